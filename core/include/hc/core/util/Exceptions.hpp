#pragma once

#include <stdexcept>
#include <string>

namespace hc {

// Base of every error raised by hc_core
class Error : public std::runtime_error
{
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Angle, slice index or collection index outside its domain
class OutOfRange : public Error
{
public:
    explicit OutOfRange(const std::string& msg) : Error(msg) {}
};

// Perimeter requested for a contour with fewer than 2 points
class EmptyContour : public Error
{
public:
    EmptyContour() : Error("Contour needs at least 2 points") {}
};

class EmptyCollection : public Error
{
public:
    explicit EmptyCollection(const std::string& op)
        : Error("Cannot " + op + " on an empty volume collection")
    {
    }
};

// The last remaining volume of a collection cannot be removed
class SingleElement : public Error
{
public:
    SingleElement() : Error("Cannot remove the only volume in the collection") {}
};

class ResampleError : public Error
{
public:
    explicit ResampleError(const std::string& msg) : Error(msg) {}
};

// Reading or writing volumes, exports and config files
class IOError : public Error
{
public:
    explicit IOError(const std::string& msg) : Error(msg) {}
};

}  // namespace hc
