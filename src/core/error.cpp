#include "offload/core/error.hpp"

#include <utility>

namespace offload {

namespace {

class work_category_impl final : public std::error_category {
public:
    const char* name() const noexcept override {
        return "offload";
    }

    std::string message(int value) const override {
        switch (static_cast<work_errc>(value)) {
        case work_errc::cancelled:
            return "operation cancelled";
        case work_errc::failed:
            return "operation failed";
        case work_errc::unhandled_exception:
            return "task body threw an unknown exception";
        case work_errc::pool_closed:
            return "worker pool is shut down";
        }
        return "unknown offload error";
    }
};

} // namespace

const std::error_category& work_category() noexcept {
    static const work_category_impl category{};
    return category;
}

std::error_code make_error_code(work_errc code) noexcept {
    return std::error_code{static_cast<int>(code), work_category()};
}

error::error(std::error_code code) noexcept : code_(code) {}

error::error(std::error_code code, std::string message)
    : code_(code), message_(std::move(message)) {}

error error::from_errno(int value) noexcept {
    return error{std::error_code{value, std::system_category()}};
}

std::error_code error::code() const noexcept {
    return code_;
}

int error::value() const noexcept {
    return code_.value();
}

std::string error::message() const {
    if (!message_.empty()) {
        return message_;
    }
    return code_.message();
}

bool error::is_cancellation() const noexcept {
    return code_ == make_error_code(work_errc::cancelled);
}

error make_error_from_errno(int value) noexcept {
    return error::from_errno(value);
}

error make_error(work_errc code) {
    return error{make_error_code(code)};
}

error make_error(std::string message) {
    return error{make_error_code(work_errc::failed), std::move(message)};
}

} // namespace offload
