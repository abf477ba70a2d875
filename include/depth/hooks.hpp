#ifndef DEPTH_HOOKS_HPP
#define DEPTH_HOOKS_HPP

#include <string>

#include "types.hpp"
#include "errors.hpp"

namespace depth {

// =============================================================================
// Engine Hook Interface
// =============================================================================
//
// Committed events are delivered after the operation that produced them has
// succeeded, in the order they occurred. A rolled-back operation delivers
// only on_operation_rejected. An exception escaping a hook does not affect
// the operation or the delivery of later events.

class IEngineHooks {
public:
    virtual ~IEngineHooks() = default;

    virtual void on_stable_minted(const Address& caller, I128 native_in, I128 fee, I128 minted) {}
    virtual void on_stable_burned(const Address& caller, I128 burned, I128 fee, I128 refunded) {}

    virtual void on_buffer_pool_created(const Address& creator) {}

    // price_wad: buffer units per stable unit of surplus used for the mint
    virtual void on_buffer_minted(const Address& caller, I128 native_in, I128 minted, I128 price_wad) {}
    virtual void on_buffer_burned(const Address& caller, I128 burned, I128 refunded, I128 price_wad) {}

    virtual void on_transfer(const std::string& symbol, const Address& from, const Address& to, I128 amount) {}

    virtual void on_operation_rejected(const std::string& operation, ErrorCode code, const std::string& reason) {}
};

// Null hooks (no-op)
class NullHooks : public IEngineHooks {};

} // namespace depth

#endif // DEPTH_HOOKS_HPP
