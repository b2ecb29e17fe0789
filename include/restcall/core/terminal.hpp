#pragma once

namespace restcall {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Color is used for stderr logs when stderr is a TTY, NO_COLOR is unset and
/// the caller did not force it off.
bool UseColorForStderr(bool force_no_color);

} // namespace restcall
