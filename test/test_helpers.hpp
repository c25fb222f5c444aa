// cpamm - shared test helpers

#pragma once

#include <catch2/catch_tostring.hpp>
#include <cpamm/types.hpp>
#include <cpamm/math.hpp>

namespace Catch {

template <>
struct StringMaker<unsigned __int128> {
    static std::string convert(unsigned __int128 v) { return cpamm::to_string(v); }
};

template <>
struct StringMaker<cpamm::U256> {
    static std::string convert(const cpamm::U256& v) {
        return "{hi=" + cpamm::to_string(v.hi) + ", lo=" + cpamm::to_string(v.lo) + "}";
    }
};

}  // namespace Catch

namespace cpamm::test {

constexpr Balance B(unsigned long long v) { return static_cast<Balance>(v); }

inline const Address ALICE = address_from_id(0xA11CE);
inline const Address BOB = address_from_id(0xB0B);
inline const Address CAROL = address_from_id(0xCA201);

}  // namespace cpamm::test
