#pragma once
#include <stdexcept>

namespace tagged {
///
/// \brief Base tagged exception.
///
struct Error : std::runtime_error {
	using std::runtime_error::runtime_error;
};

///
/// \brief Neither the single-value nor the structured decoding path could read the raw value.
///
struct DecodeError : Error {
	using Error::Error;
};

///
/// \brief A structured encoder reported failure.
///
struct EncodeError : Error {
	using Error::Error;
};

///
/// \brief Text was not a lossless description of the raw value.
///
struct ParseError : Error {
	using Error::Error;
};
} // namespace tagged
