// Implementation of ratio literal parsing and exponent vector conversion.

#include "core/ratio_codec.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

#include "core/exponent_vector.h"
#include "core/pitch_utils.h"
#include "core/prime_utils.h"

namespace justpitch {

namespace {

std::string trimWhitespace(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}

/// @brief Parse an optionally signed decimal integer of any width.
/// @return False unless the whole (trimmed) text is an integer.
bool parseInteger(const std::string& text, BigInt& out) {
  std::string body = trimWhitespace(text);
  size_t pos = 0;
  bool negative = false;
  if (pos < body.size() && (body[pos] == '+' || body[pos] == '-')) {
    negative = body[pos] == '-';
    ++pos;
  }
  if (pos >= body.size()) return false;

  BigInt value = 0;
  for (; pos < body.size(); ++pos) {
    char chr = body[pos];
    if (chr < '0' || chr > '9') return false;
    value = value * 10 + (chr - '0');
  }
  out = negative ? BigInt(-value) : value;
  return true;
}

RatioResult parseFailure(const std::string& text, const char* reason) {
  RatioResult result;
  result.error = PitchError::ParseError;
  result.error_message = "Invalid ratio literal '" + text + "': " + reason;
  return result;
}

/// Floor division for a positive divisor.
BigInt floorDiv(const BigInt& num, const BigInt& den) {
  BigInt quotient = num / den;
  if (num < 0 && quotient * den != num) --quotient;
  return quotient;
}

}  // namespace

RatioResult parseRatioString(const std::string& text) {
  size_t slash = text.find('/');
  if (slash == std::string::npos) return parseFailure(text, "missing '/'");
  if (text.find('/', slash + 1) != std::string::npos) {
    return parseFailure(text, "more than one '/'");
  }

  BigInt numerator;
  BigInt denominator;
  if (!parseInteger(text.substr(0, slash), numerator)) {
    return parseFailure(text, "numerator is not an integer");
  }
  if (!parseInteger(text.substr(slash + 1), denominator)) {
    return parseFailure(text, "denominator is not an integer");
  }
  if (denominator == 0) return parseFailure(text, "zero denominator");
  // boost::rational rejects a negative denominator for cpp_int.
  if (denominator < 0) {
    numerator = -numerator;
    denominator = -denominator;
  }

  RatioResult result;
  result.ratio = Ratio(numerator, denominator);
  return result;
}

std::string ratioToString(const Ratio& ratio) {
  return ratio.numerator().str() + "/" + ratio.denominator().str();
}

double ratioToDouble(const Ratio& ratio) {
  return ratio.numerator().convert_to<double>() / ratio.denominator().convert_to<double>();
}

ExponentVectorResult ratioToExponentVector(const Ratio& ratio) {
  ExponentVectorResult result;
  if (ratio.numerator() <= 0) {
    result.error = PitchError::UnsupportedType;
    result.error_message = "Ratio " + ratioToString(ratio) + " is not positive";
    return result;
  }

  PrimeFactorMap numerator_factors;
  PrimeFactorMap denominator_factors;
  if (!factorize(ratio.numerator(), numerator_factors) ||
      !factorize(ratio.denominator(), denominator_factors)) {
    result.error = PitchError::UnsupportedType;
    result.error_message = "Ratio " + ratioToString(ratio) + " has a prime factor above 2^64";
    return result;
  }

  auto accumulate = [&result](const PrimeFactorMap& factors, int sign) {
    for (const auto& [prime, count] : factors) {
      auto index = primeIndex(prime);
      if (!index) {
        result.error = PitchError::UnsupportedType;
        result.error_message = "Prime factor " + std::to_string(prime) + " exceeds the supported limit";
        return false;
      }
      if (result.exponents.size() <= *index) result.exponents.resize(*index + 1, 0);
      result.exponents[*index] += sign * count;
    }
    return true;
  };

  if (!accumulate(numerator_factors, 1) || !accumulate(denominator_factors, -1)) {
    result.exponents.clear();
    return result;
  }
  trimTrailingZeros(result.exponents);
  return result;
}

std::pair<BigInt, BigInt> exponentVectorToPair(const ExponentVector& exponents) {
  std::vector<uint64_t> primes = firstPrimes(exponents.size());
  BigInt numerator = 1;
  BigInt denominator = 1;
  for (size_t idx = 0; idx < exponents.size(); ++idx) {
    int exponent = exponents[idx];
    if (exponent > 0) {
      numerator *= boost::multiprecision::pow(BigInt(primes[idx]), static_cast<unsigned>(exponent));
    } else if (exponent < 0) {
      denominator *= boost::multiprecision::pow(BigInt(primes[idx]), static_cast<unsigned>(-exponent));
    }
  }
  return {numerator, denominator};
}

Ratio exponentVectorToRatio(const ExponentVector& exponents) {
  auto [numerator, denominator] = exponentVectorToPair(exponents);
  return Ratio(numerator, denominator);
}

Ratio doubleToRatio(double value) {
  if (!std::isfinite(value) || value == 0.0) return Ratio();

  int exponent = 0;
  double mantissa = std::frexp(value, &exponent);
  // 53 mantissa bits make the scaled value an exact integer.
  auto scaled = static_cast<int64_t>(std::ldexp(mantissa, 53));
  exponent -= 53;

  BigInt numerator = scaled;
  BigInt denominator = 1;
  if (exponent > 0) {
    numerator <<= exponent;
  } else {
    denominator <<= -exponent;
  }
  return Ratio(numerator, denominator);
}

Ratio limitDenominator(const Ratio& ratio, uint32_t max_denominator) {
  BigInt limit = max_denominator < 1 ? 1 : max_denominator;
  if (ratio.denominator() <= limit) return ratio;

  // Convergents p/q of the continued fraction of ratio.
  BigInt p0 = 0;
  BigInt q0 = 1;
  BigInt p1 = 1;
  BigInt q1 = 0;
  BigInt num = ratio.numerator();
  BigInt den = ratio.denominator();
  while (true) {
    BigInt term = floorDiv(num, den);
    BigInt q2 = q0 + term * q1;
    if (q2 > limit) break;
    BigInt p2 = p0 + term * p1;
    p0 = p1;
    q0 = q1;
    p1 = p2;
    q1 = q2;
    BigInt remainder = num - term * den;
    num = den;
    den = remainder;
  }

  // Best semiconvergent against the last convergent.
  BigInt steps = (limit - q0) / q1;
  Ratio bound1(BigInt(p0 + steps * p1), BigInt(q0 + steps * q1));
  Ratio bound2(p1, q1);
  if (boost::abs(bound2 - ratio) <= boost::abs(bound1 - ratio)) return bound2;
  return bound1;
}

std::optional<Ratio> centsToRatio(double cents, uint32_t max_denominator) {
  if (!std::isfinite(cents)) return std::nullopt;

  double octaves = std::floor(cents / kOctaveInCents);
  if (std::fabs(octaves) > kMaxCentsOctaves) return std::nullopt;
  double remainder = cents - octaves * kOctaveInCents;
  Ratio result = limitDenominator(doubleToRatio(centsToFrequencyRatio(remainder)),
                                  max_denominator);

  int octave_count = static_cast<int>(octaves);
  BigInt power = BigInt(1) << std::abs(octave_count);
  if (octave_count >= 0) {
    result *= power;
  } else {
    result /= power;
  }
  return result;
}

}  // namespace justpitch
