/**
 * @file command_executor.hpp
 * @brief Process execution for nftables-firewall
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * This file contains the CommandExecutor class which runs external programs
 * (the nft front end, iproute2) with an optional standard input document and
 * captures both output streams separately.
 */

#pragma once

#include <string>
#include <vector>

namespace nftfw {

/**
 * @struct CommandResult
 * @brief Outcome of one child process
 *
 * success only says that the process ran to completion. Whether the program
 * itself was happy is in exit_code and stderr_output.
 */
struct CommandResult {
    bool success = false;           ///< Whether the process was started and waited for
    int exit_code = -1;             ///< Process exit code (0 = success)
    std::string stdout_output;      ///< Standard output from the command
    std::string stderr_output;      ///< Standard error output from the command
    std::string command;            ///< The command line that was executed

    bool isSuccess() const { return success && exit_code == 0; }

    /// One line summary for log messages, empty for a clean exit
    std::string getErrorMessage() const {
        if (isSuccess()) {
            return "";
        }

        std::string message = command.empty() ? std::string("<no command>") : command;
        message += success ? " exited with status " + std::to_string(exit_code) : " could not be run";
        if (!stderr_output.empty()) {
            message += ": " + stderr_output.substr(0, stderr_output.find('\n'));
        }
        return message;
    }
};

/**
 * @class CommandExecutor
 * @brief Runs programs without a shell and captures their output
 *
 * Arguments are passed to execvp() directly, so no escaping is involved.
 * Standard input, output and error are connected through pipes which are
 * serviced together, so large documents in either direction cannot dead
 * lock the child.
 */
class CommandExecutor {
public:
    /**
     * @brief Execute a program with argument vector
     * @param args Command arguments (first is the program, rest are arguments)
     * @return CommandResult with execution details
     *
     * An empty argument vector yields a failed result.
     */
    static CommandResult execute(const std::vector<std::string>& args);

    /**
     * @brief Execute a program and feed it a document on standard input
     * @param args Command arguments (first is the program)
     * @param input Data written to the child's standard input
     * @return CommandResult with execution details
     *
     * success is false when the process could not be created or a pipe
     * failed; the reason is in stderr_output.
     */
    static CommandResult execute(const std::vector<std::string>& args, const std::string& input);

    /**
     * @brief Check if a program can be found in PATH
     * @param program Program name or absolute path
     */
    static bool isAvailable(const std::string& program);

    /**
     * @brief Convert argument vector to a printable command line
     *
     * Only used for logging and CommandResult::command.
     */
    static std::string argsToCommand(const std::vector<std::string>& args);

private:
    /**
     * @brief Quote an argument for display
     *
     * Single quotes are used when the argument contains characters a shell
     * would interpret.
     */
    static std::string escapeShellArg(const std::string& arg);
};

} // namespace nftfw
