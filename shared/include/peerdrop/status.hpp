/**
 * PeerDrop - Typed success/error values returned by coordinator and engine calls.
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "peerdrop/error_codes.hpp"

namespace peerdrop
{

    struct Status
    {
        ErrorCode code{ErrorCode::Ok};
        std::string message{};

        bool ok() const noexcept { return code == ErrorCode::Ok; }

        static Status success() { return {}; }

        static Status failure(ErrorCode code, std::string message)
        {
            return Status{code, std::move(message)};
        }
    };

    template <typename T>
    class Result
    {
    public:
        Result(T value) : value_(std::move(value)) {}

        Result(Status status) : status_(std::move(status))
        {
            if (status_.ok())
            {
                throw std::logic_error("Result constructed from a success status without a value");
            }
        }

        static Result failure(ErrorCode code, std::string message)
        {
            return Result(Status::failure(code, std::move(message)));
        }

        bool ok() const noexcept { return status_.ok(); }
        explicit operator bool() const noexcept { return ok(); }

        const Status &status() const noexcept { return status_; }
        ErrorCode error() const noexcept { return status_.code; }
        const std::string &message() const noexcept { return status_.message; }

        const T &value() const &
        {
            if (!value_)
            {
                throw std::logic_error("Result has no value: " + status_.message);
            }
            return *value_;
        }

        T &&value() &&
        {
            if (!value_)
            {
                throw std::logic_error("Result has no value: " + status_.message);
            }
            return std::move(*value_);
        }

    private:
        Status status_{};
        std::optional<T> value_{};
    };

} // namespace peerdrop
