#include "nalstream/util.hh"

thread_local nls_error_t nls_errno;
