#include "bootstrap.hh"

#include "debug.hh"

nalstream::bootstrap::bootstrap() :
    state_(BOOTSTRAP_STATE::BS_AWAITING_PRIMARY),
    pending_primary_(),
    config_(),
    dropped_(0),
    renegotiations_(0)
{
}

nalstream::bootstrap::~bootstrap()
{
}

int nalstream::bootstrap::handle_unit(const nalstream::unit::encoded_unit& unit)
{
    switch (unit.kind) {
        case NLS_UNIT_CONFIG_PRIMARY:
            return handle_primary(unit.data);

        case NLS_UNIT_CONFIG_SECONDARY:
            return handle_secondary(unit.data);

        default:
            break;
    }

    if (state_ != BOOTSTRAP_STATE::BS_READY) {
        /* no configuration, decoder could not make anything out of this */
        ++dropped_;
        return BA_DROP;
    }

    return BA_DECODE;
}

int nalstream::bootstrap::handle_primary(const std::vector<uint8_t>& data)
{
    int actions = BA_NONE;

    if (state_ == BOOTSTRAP_STATE::BS_READY) {
        if (data == config_.primary)
            return BA_NONE;

        NLS_LOG_INFO("Primary configuration unit changed, renegotiating (old fingerprint 0x%08x)",
            config_.fingerprint);

        ++renegotiations_;
        config_ = nalstream::unit::configuration_set();
        state_  = BOOTSTRAP_STATE::BS_AWAITING_PRIMARY;
        actions = BA_INVALIDATE;
    }

    if (state_ == BOOTSTRAP_STATE::BS_AWAITING_SECONDARY)
        NLS_LOG_DEBUG("Primary configuration unit replaced before its secondary arrived");

    pending_primary_ = data;
    state_           = BOOTSTRAP_STATE::BS_AWAITING_SECONDARY;

    return actions;
}

int nalstream::bootstrap::handle_secondary(const std::vector<uint8_t>& data)
{
    switch (state_) {
        case BOOTSTRAP_STATE::BS_AWAITING_PRIMARY:
            NLS_LOG_DEBUG("Secondary configuration unit without a primary, dropping it");
            ++dropped_;
            return BA_DROP;

        case BOOTSTRAP_STATE::BS_AWAITING_SECONDARY:
            config_ = nalstream::unit::make_configuration(pending_primary_, data);
            pending_primary_.clear();
            state_ = BOOTSTRAP_STATE::BS_READY;

            NLS_LOG_INFO("Configuration complete, fingerprint 0x%08x", config_.fingerprint);
            return BA_CREATE;

        case BOOTSTRAP_STATE::BS_READY:
            break;
    }

    if (data == config_.secondary)
        return BA_NONE;

    /* primary still holds, so the new pair is complete right away */
    uint32_t old_fingerprint = config_.fingerprint;

    ++renegotiations_;
    config_ = nalstream::unit::make_configuration(config_.primary, data);

    NLS_LOG_INFO("Secondary configuration unit changed, renegotiating (fingerprint 0x%08x -> 0x%08x)",
        old_fingerprint, config_.fingerprint);

    return BA_INVALIDATE | BA_CREATE;
}

void nalstream::bootstrap::construction_failed()
{
    NLS_LOG_WARN("Decoder rejected configuration 0x%08x, waiting for the next configuration pair",
        config_.fingerprint);

    config_ = nalstream::unit::configuration_set();
    pending_primary_.clear();
    state_ = BOOTSTRAP_STATE::BS_AWAITING_PRIMARY;
}

void nalstream::bootstrap::reset()
{
    config_ = nalstream::unit::configuration_set();
    pending_primary_.clear();
    state_ = BOOTSTRAP_STATE::BS_AWAITING_PRIMARY;
}

nalstream::BOOTSTRAP_STATE nalstream::bootstrap::get_state() const
{
    return state_;
}

const nalstream::unit::configuration_set& nalstream::bootstrap::configuration() const
{
    return config_;
}

uint64_t nalstream::bootstrap::dropped_units() const
{
    return dropped_;
}

uint64_t nalstream::bootstrap::renegotiations() const
{
    return renegotiations_;
}
