#pragma once

#include "dispatch/ClientSinkInterface.h"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Switchboard::Tests {

/**
 * @brief Client end of a socket that records everything sent to it.
 */
class FakeClientSink : public ClientSinkInterface {
public:
    Result<std::monostate, std::string> sendText(const std::string& text) override;
    void close(int code, const std::string& reason) override;
    bool isOpen() const override;

    // Parsed copies of every text sent so far.
    std::vector<nlohmann::json> messages() const;

    // Discriminator values of every message sent so far, "" where absent.
    std::vector<std::string> discriminators(const std::string& field = "action") const;

    void clear();

    // Blocks until at least `count` messages were sent.
    bool waitForMessages(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(2));

    std::optional<int> closeCode() const;
    std::string closeReason() const;

    // Makes subsequent sends fail as a broken socket would.
    void setFailSends(bool fail);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> sent_;
    bool open_ = true;
    bool failSends_ = false;
    std::optional<int> closeCode_;
    std::string closeReason_;
};

} // namespace Switchboard::Tests
