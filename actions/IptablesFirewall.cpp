#include "IptablesFirewall.hpp"
#include "../common/Address.hpp"
#include <iostream>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace lan_warden::actions
{
    namespace
    {
        // Upper bound on -D passes when duplicate rules were added by hand
        constexpr int MAX_DELETE_PASSES = 16;
    }

    IptablesFirewall::IptablesFirewall(std::string binary) : m_binary(std::move(binary)) {}

    std::vector<std::vector<std::string>> IptablesFirewall::RulesFor(const std::string &ip)
    {
        return {
            {"INPUT", "-s", ip, "-j", "DROP"},
            {"OUTPUT", "-d", ip, "-j", "DROP"}};
    }

    int IptablesFirewall::Run(const std::string &op, const std::vector<std::string> &rule) const
    {
        std::vector<std::string> args;
        args.push_back(m_binary);
        args.push_back(op);
        args.insert(args.end(), rule.begin(), rule.end());

        std::vector<char *> argv;
        for (auto &arg : args)
            argv.push_back(const_cast<char *>(arg.c_str()));
        argv.push_back(nullptr);

        pid_t pid = fork();
        if (pid < 0)
        {
            std::cerr << "[Firewall] fork failed: " << std::strerror(errno) << "\n";
            return -1;
        }

        if (pid == 0)
        {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0)
            {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
            execvp(argv[0], argv.data());
            _exit(127);
        }

        int status = 0;
        while (waitpid(pid, &status, 0) < 0)
        {
            if (errno != EINTR)
                return -1;
        }

        if (!WIFEXITED(status))
            return -1;
        return WEXITSTATUS(status);
    }

    common::Result IptablesFirewall::Block(const std::string &ip)
    {
        if (!common::ParseIpv4(ip))
            return common::Result::Fail("invalid address '" + ip + "'");

        for (const auto &rule : RulesFor(ip))
        {
            if (Run("-C", rule) == 0)
                continue;

            int rc = Run("-A", rule);
            if (rc != 0)
                return common::Result::Fail(m_binary + " -A " + rule[0] + " for " + ip + " exited with " + std::to_string(rc));
        }

        std::cout << "[Firewall] Blocked " << ip << "\n";
        return common::Result::Ok();
    }

    common::Result IptablesFirewall::Unblock(const std::string &ip)
    {
        if (!common::ParseIpv4(ip))
            return common::Result::Fail("invalid address '" + ip + "'");

        for (const auto &rule : RulesFor(ip))
        {
            for (int pass = 0; pass < MAX_DELETE_PASSES && Run("-C", rule) == 0; ++pass)
            {
                int rc = Run("-D", rule);
                if (rc != 0)
                    return common::Result::Fail(m_binary + " -D " + rule[0] + " for " + ip + " exited with " + std::to_string(rc));
            }
        }

        std::cout << "[Firewall] Unblocked " << ip << "\n";
        return common::Result::Ok();
    }
}
