#ifndef DEPTH_TEST_SUPPORT_HPP
#define DEPTH_TEST_SUPPORT_HPP

#include <catch2/catch_tostring.hpp>

#include <string>

#include "depth/types.hpp"
#include "depth/wad.hpp"

// Print 128-bit amounts in assertion messages
namespace Catch {
template <>
struct StringMaker<depth::I128> {
    static std::string convert(depth::I128 value) {
        return depth::wad::to_integer_string(value);
    }
};
}  // namespace Catch

namespace depth {
namespace test {

// Decimal amount in base units
inline I128 amt(const char* s) {
    return wad::parse(s);
}

inline const Address ALICE = addresses::from_id(1);
inline const Address BOB = addresses::from_id(2);
inline const Address CAROL = addresses::from_id(3);

}  // namespace test
}  // namespace depth

#endif // DEPTH_TEST_SUPPORT_HPP
