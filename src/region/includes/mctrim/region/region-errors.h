#pragma once

#include <stdexcept>
#include <string>

namespace mctrim::region {

// Base exception for region container errors
class ContainerError : public std::runtime_error
{
public:
    explicit ContainerError(const std::string& msg) : std::runtime_error(msg)
    {
    }
};

// Location/timestamp tables missing or inconsistent
class InvalidHeaderError : public ContainerError
{
public:
    explicit InvalidHeaderError(const std::string& msg) : ContainerError(msg)
    {
    }
};

// Record uses a compression scheme other than zlib
class UnsupportedCompressionError : public ContainerError
{
public:
    explicit UnsupportedCompressionError(const std::string& msg)
        : ContainerError(msg)
    {
    }
};

// Record header or body extends past the available bytes
class TruncatedPayloadError : public ContainerError
{
public:
    explicit TruncatedPayloadError(const std::string& msg)
        : ContainerError(msg)
    {
    }
};

class DecompressionError : public ContainerError
{
public:
    explicit DecompressionError(const std::string& msg) : ContainerError(msg)
    {
    }
};

// Fast field scan found no occurrence of the requested field
class FieldNotFoundError : public ContainerError
{
public:
    explicit FieldNotFoundError(const std::string& msg) : ContainerError(msg)
    {
    }
};

// Reading or writing a container file failed
class ContainerIOError : public ContainerError
{
public:
    explicit ContainerIOError(const std::string& msg) : ContainerError(msg)
    {
    }
};

}  // namespace mctrim::region
