#pragma once

/* Including this header will include all the necessary headers for using nalstream, but
 * you can also include the headers individually instead of this header. */

#include "binder.hh"         // binder class
#include "decoder.hh"        // decoder interface
#include "transport.hh"      // transport interface
#include "tcp_transport.hh"  // TCP transport

#include "unit.hh"           // unit related functions
#include "util.hh"           // types
#include "version.hh"        // version
