// Copyright (C) 2026 The apiref authors
//
// This program is free software; you can redistribute it and/or modify it
// under the terms of the GNU General Public License as published by the Free
// Software Foundation; either version 3 of the License, or (at your option)
// any later version.
//
// This program is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
// more details.
//
// You should have received a copy of the GNU General Public License along with
// this program; if not, write to the Free Software Foundation, Inc., 51
// Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace core {

// Don't throw or catch ErrorBase directly, use a subclass.
class ErrorBase : public std::runtime_error
{
  using std::runtime_error::runtime_error;
};

// Throw an Error to indicate a potentially non-fatal error that may be caught
// and handled by callers. An uncaught Error that reaches the top level will be
// treated similar to Fatal.
class Error : public ErrorBase
{
  using ErrorBase::ErrorBase;
};

// Throw a Fatal to make apiref print the error message to stderr and exit
// with a non-zero exit code.
class Fatal : public ErrorBase
{
  using ErrorBase::ErrorBase;
};

// Bad command line arguments or configuration values.
class ValidationError : public Error
{
  using Error::Error;
};

// The package installation command is missing, timed out or failed.
class InstallError : public Fatal
{
public:
  explicit InstallError(const std::string& message,
                        std::string stdout_data = {},
                        std::string stderr_data = {});

  const std::string& stdout_data() const;
  const std::string& stderr_data() const;

private:
  std::string m_stdout_data;
  std::string m_stderr_data;
};

class DownloadError : public Fatal
{
public:
  enum class Reason { network, http_status, conflict, io };

  DownloadError(Reason reason, const std::string& message);

  Reason reason() const;

private:
  Reason m_reason;
};

inline InstallError::InstallError(const std::string& message,
                                  std::string stdout_data,
                                  std::string stderr_data)
  : Fatal(message),
    m_stdout_data(std::move(stdout_data)),
    m_stderr_data(std::move(stderr_data))
{
}

inline const std::string&
InstallError::stdout_data() const
{
  return m_stdout_data;
}

inline const std::string&
InstallError::stderr_data() const
{
  return m_stderr_data;
}

inline DownloadError::DownloadError(Reason reason, const std::string& message)
  : Fatal(message),
    m_reason(reason)
{
}

inline DownloadError::Reason
DownloadError::reason() const
{
  return m_reason;
}

} // namespace core
