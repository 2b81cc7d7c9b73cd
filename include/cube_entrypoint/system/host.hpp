#pragma once

#include "../common/types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <sys/types.h>

namespace cube_entrypoint {
namespace system {

struct CommandSpec {
    std::vector<std::string> argv;
    std::optional<common::Environment> env;
    std::optional<common::Account> run_as;
    bool capture_output = false;
};

struct CommandResult {
    int exit_code = -1;
    std::string output;
    int spawn_errno = 0;

    bool succeeded() const { return spawn_errno == 0 && exit_code == 0; }
};

// Everything the bootstrap stages need from the operating system beyond
// plain filesystem probes. Tests substitute a recording implementation.
class HostSystem {
public:
    virtual ~HostSystem() = default;

    virtual CommandResult run(const CommandSpec& spec) = 0;
    virtual std::optional<common::Account> lookupAccount(const std::string& name) = 0;
    virtual std::optional<common::Account> lookupAccount(uid_t uid) = 0;
};

class PosixHostSystem : public HostSystem {
public:
    CommandResult run(const CommandSpec& spec) override;
    std::optional<common::Account> lookupAccount(const std::string& name) override;
    std::optional<common::Account> lookupAccount(uid_t uid) override;
};

std::string describeCommand(const std::vector<std::string>& argv);

}}
