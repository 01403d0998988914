#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <stdexcept>
#include <string>

namespace preflight
{
// Every failure the engine reports derives from PreflightError. The C
// boundary flattens all of them into a single error string.
class PreflightError : public std::runtime_error
{
  public:
    explicit PreflightError(std::string const& msg) : std::runtime_error(msg)
    {
    }
};

// Malformed input payload: bad base64, bad XDR, null argument or an
// operation the entry point does not handle.
class EncodingError : public PreflightError
{
  public:
    explicit EncodingError(std::string const& msg) : PreflightError(msg)
    {
    }
};

// The snapshot or network configuration returned missing or wrong-shaped
// data.
class IntegrationError : public PreflightError
{
  public:
    explicit IntegrationError(std::string const& msg) : PreflightError(msg)
    {
    }
};

// Storage and footprint disagree, or the host produced an impossible
// payload. Indicates a bug in the engine or in the host.
class InvariantViolation : public PreflightError
{
  public:
    explicit InvariantViolation(std::string const& msg) : PreflightError(msg)
    {
    }
};

// Fault raised by the contract host itself.
class EngineFault : public PreflightError
{
  public:
    explicit EngineFault(std::string const& msg) : PreflightError(msg)
    {
    }
};

// The host aborted the invocation (e.g. an internal panic). Distinct from a
// contract that merely returned an error.
class HostPanic : public EngineFault
{
  public:
    explicit HostPanic(std::string const& msg) : EngineFault(msg)
    {
    }
};
}
