#pragma once
#include <string>
#include <vector>
#include "agent/ICodingBackend.h"

/**
 * @brief Runs prompts through the `claude` command-line tool.
 *
 * Each request spawns `<command> -p <prompt> --output-format text
 * --permission-mode bypassPermissions [--model <model>]` in the requested
 * working directory and waits for it to exit.
 */
class ClaudeCliBackend : public ICodingBackend {
public:
    explicit ClaudeCliBackend(const std::string& command = "claude", const std::string& model = "");

    std::string name() const override;
    std::string run(const BackendRequest& request) override;

    std::vector<std::string> buildArguments(const std::string& prompt) const;

private:
    std::string command;
    std::string model;
};
