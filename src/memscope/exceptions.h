#pragma once

#include <stdexcept>

namespace memscope::exception {

class MemscopeException : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

class IoError : public MemscopeException
{
    using MemscopeException::MemscopeException;
};

// The target process is absent or cannot be inspected at all.
class AttachFailure : public MemscopeException
{
    using MemscopeException::MemscopeException;
};

class SpawnFailure : public MemscopeException
{
    using MemscopeException::MemscopeException;
};

// One inspection of the target failed. Recovered by skipping the tick.
class SampleReadError : public MemscopeException
{
    using MemscopeException::MemscopeException;
};

class OutputWriteFailure : public MemscopeException
{
    using MemscopeException::MemscopeException;
};

}  // namespace memscope::exception
