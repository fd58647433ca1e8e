#pragma once

#include <string>
#include <utility>

namespace lan_warden::common
{
    // Outcome of an action or mutation. Callers decide whether to retry or ignore.
    struct Result
    {
        bool ok = true;
        std::string error;

        static Result Ok() { return Result{}; }

        static Result Fail(std::string reason)
        {
            Result result;
            result.ok = false;
            result.error = std::move(reason);
            return result;
        }

        explicit operator bool() const { return ok; }
    };
}
