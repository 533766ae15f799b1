/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef COMMAND_H
#define COMMAND_H

#include <string>
#include <vector>

namespace WallpaperRotate {

//!
//! \brief Outcome of one external command.
//!
struct CommandResult
{
    //! Exit status of the child. 128 + signal number if it was killed, 127 if it could not be executed, -1 if it could
    //! not be started at all.
    int m_exit_code = -1;

    //! Everything the child wrote to stdout. The child's stderr is inherited from the daemon.
    std::string m_output;

    bool Succeeded() const { return m_exit_code == 0; }
};

//!
//! \brief The CommandRunner class is the seam between the desktop backends and the processes they start. The production
//! implementation forks. Tests substitute a recorder.
//!
class CommandRunner
{
public:
    virtual ~CommandRunner() = default;

    //!
    //! \brief Runs argv[0] with the given arguments, found through PATH, and blocks until it exits. No shell is involved.
    //! \param argv program and arguments. Must not be empty.
    //! \return CommandResult
    //!
    virtual CommandResult Run(const std::vector<std::string>& argv) = 0;
};

class ProcessCommandRunner : public CommandRunner
{
public:
    CommandResult Run(const std::vector<std::string>& argv) override;
};

//!
//! \brief Joins argv with spaces for log messages.
//!
std::string CommandToString(const std::vector<std::string>& argv);

} // namespace WallpaperRotate

#endif // COMMAND_H
