// =============================================================================
// blkstore - Error Channels Implementation
// =============================================================================

#include "blkstore/concurrency/error_channel.h"

#include <algorithm>
#include <iterator>

#include "blkstore/common/logger.h"

namespace blkstore::concurrency {

MergedErrors::MergedErrors(std::stop_token cancel,
                           std::vector<std::shared_ptr<ErrorChannel>> inputs) {
    std::erase_if(inputs, [](const auto& input) { return input == nullptr; });

    output_ = std::make_shared<ErrorChannel>(std::max<std::size_t>(inputs.size(), 1));
    if (inputs.empty()) {
        output_->close();
        return;
    }

    // Runs inline when cancel is already stopped.
    cancelLink_.emplace(std::move(cancel), [this] { stopSource_.request_stop(); });

    try {
        forwarders_.reserve(inputs.size());
        for (auto& input : inputs) {
            forwarders_.emplace_back([this, input = std::move(input)] { forward(input); });
        }

        closer_ = std::thread([this] {
            for (auto& forwarder : forwarders_) {
                forwarder.join();
            }
            output_->close();
            BLKSTORE_LOG_DEBUG("Merged error channel closed after {} inputs", forwarders_.size());
        });
    } catch (...) {
        // Threads already started must not outlive a half-built object.
        stopAndJoin();
        throw;
    }
}

MergedErrors::~MergedErrors() {
    stopAndJoin();
}

void MergedErrors::stopAndJoin() noexcept {
    stopSource_.request_stop();
    if (closer_.joinable()) {
        closer_.join();
        return;
    }
    for (auto& forwarder : forwarders_) {
        if (forwarder.joinable()) {
            forwarder.join();
        }
    }
    output_->close();
}

void MergedErrors::forward(const std::shared_ptr<ErrorChannel>& input) {
    const std::stop_token stopToken = stopSource_.get_token();
    // One error per operation; anything sent after it is not forwarded.
    if (auto error = input->receive(stopToken)) {
        output_->send(std::move(*error), stopToken);
    }
}

std::vector<Error> MergedErrors::drain() {
    std::vector<Error> errors;
    while (auto error = output_->receive()) {
        errors.push_back(std::move(*error));
    }
    return errors;
}

std::unique_ptr<MergedErrors> mergeErrorChannels(
    std::stop_token cancel, std::vector<std::shared_ptr<ErrorChannel>> channels) {
    return std::make_unique<MergedErrors>(std::move(cancel), std::move(channels));
}

}  // namespace blkstore::concurrency
