#include "offload/runtime/work_context.hpp"

#include <utility>

namespace offload::runtime {

work_context::work_context(cancellation_token token, std::uint64_t worker_id,
                           progress_sink sink)
    : token_(std::move(token)), worker_id_(worker_id), sink_(std::move(sink)) {}

result<void> work_context::check_cancelled() {
    if (!token_.is_requested()) {
        return ok();
    }
    cancellation_observed_ = true;
    return err<void>(make_error(work_errc::cancelled));
}

bool work_context::cancellation_observed() const noexcept {
    return cancellation_observed_;
}

bool work_context::cancellation_requested() const noexcept {
    return token_.is_requested();
}

void work_context::progress(int percent, std::string message) {
    if (cancellation_observed_ || !sink_) {
        return;
    }
    sink_(percent, std::move(message));
}

std::uint64_t work_context::worker_id() const noexcept {
    return worker_id_;
}

const cancellation_token& work_context::token() const noexcept {
    return token_;
}

} // namespace offload::runtime
