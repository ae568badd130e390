// Basic types for just intonation pitch arithmetic

#ifndef JUSTPITCH_CORE_BASIC_TYPES_H
#define JUSTPITCH_CORE_BASIC_TYPES_H

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/rational.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace justpitch {

/// Arbitrary-precision integer. Expression templates are disabled so that
/// boost::rational can treat it like a builtin integer.
using BigInt = boost::multiprecision::number<boost::multiprecision::cpp_int_backend<>,
                                             boost::multiprecision::et_off>;

/// Exact, always-reduced fraction with a positive denominator.
using Ratio = boost::rational<BigInt>;

/// Signed exponents indexed by ascending primes (index 0 -> 2, 1 -> 3, 2 -> 5, ...).
/// Canonical form has no trailing zeros; the empty vector is 1/1.
using ExponentVector = std::vector<int>;

// ---------------------------------------------------------------------------
// Constants
// ---------------------------------------------------------------------------

/// Default concert pitch (frequency of 1/1) in Hz.
constexpr double kDefaultConcertPitchHz = 440.0;

/// Default bound for the denominator when a cents value is approximated
/// by a fraction.
constexpr uint32_t kDefaultCentsMaxDenominator = 10000;

/// Largest prime factor a ratio may carry to be stored as an exponent vector.
constexpr uint64_t kMaxSupportedPrime = uint64_t{1} << 24;

/// Largest number of octaves a cents value may span in exact arithmetic.
constexpr int kMaxCentsOctaves = 1 << 16;

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

/// Failure kinds reported by fallible operations.
enum class PitchError : uint8_t {
  None,               ///< Success.
  ParseError,         ///< Malformed ratio literal.
  UnsupportedType,    ///< Source value the engine cannot represent.
  RegisterResolution  ///< No finite register candidate was found.
};

/// @brief Convert a PitchError to a stable identifier string.
/// @param error Error kind.
/// @return Null-terminated name such as "ParseError".
const char* pitchErrorToString(PitchError error);

}  // namespace justpitch

#endif  // JUSTPITCH_CORE_BASIC_TYPES_H
