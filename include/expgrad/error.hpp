#pragma once

#include <stdexcept>
#include <string>

namespace expgrad
{

// Raised when a curve or raster parameter is outside its domain
// (subdivisions < 1, exponent <= 0 or non-finite, empty stop list, zero size).
class InvalidParameter : public std::invalid_argument
{
   public:
    explicit InvalidParameter(const std::string& what) : std::invalid_argument(what) {}
};

// Raised when a ChannelAdapter cannot express a native color as RGBA channels.
class UnsupportedColorFormat : public std::runtime_error
{
   public:
    explicit UnsupportedColorFormat(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace expgrad
