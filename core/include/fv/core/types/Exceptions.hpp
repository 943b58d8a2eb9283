#pragma once

#include <stdexcept>
#include <string>

namespace fv
{

// Base of every error the library throws
class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Invalid argument, bad index, locked mutation, unsupported element type
class InputError : public Error
{
public:
    using Error::Error;
};

// No resolvable source or container file
class NotFoundError : public Error
{
public:
    using Error::Error;
};

// A file exists but fails validation for the role it is expected to play
class FormatError : public Error
{
public:
    using Error::Error;
};

// Fewer bytes or words written than requested
class WriteError : public Error
{
public:
    using Error::Error;
};

}  // namespace fv
