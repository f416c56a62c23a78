#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "Config.h"

namespace movehub {

struct LinkTarget {
    std::string namePrefix = MOVESENSE_NAME_PREFIX;
    std::string serviceUuid = MOVESENSE_SERVICE_UUID;
    std::string commandCharUuid = MOVESENSE_COMMAND_CHAR_UUID;
    std::string notifyCharUuid = MOVESENSE_NOTIFY_CHAR_UUID;
};

/**
 * @brief An open connection to one device: a command characteristic that
 * accepts writes and a notify characteristic that delivers frames.
 *
 * write() and subscribe() completions run on the thread that drives the
 * session, either inline or from a later service pass. Frames may arrive
 * on any thread. No callback may fire after close() has returned.
 */
class Link {
public:
    using CompletionCallback = std::function<void(bool ok, const std::string& error)>;
    using FrameCallback = std::function<void(const uint8_t* data, size_t length)>;

    virtual ~Link() = default;

    virtual void write(const std::vector<uint8_t>& bytes, CompletionCallback done) = 0;
    virtual void subscribe(FrameCallback onFrame, CompletionCallback done) = 0;
    virtual void close() = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief Discovers a device and opens its service.
 *
 * open() completes exactly once, on the session's thread: with a link, or
 * with a null link and a readable error. onDrop may fire on any thread when
 * an opened link goes away, whether or not the drop was requested.
 */
class LinkProvider {
public:
    using DropCallback = std::function<void(const std::string& reason)>;
    using OpenCallback = std::function<void(std::unique_ptr<Link> link, const std::string& error)>;

    virtual ~LinkProvider() = default;

    virtual void open(const LinkTarget& target, DropCallback onDrop, OpenCallback done) = 0;

    // Abandon an open() still in progress; its completion will not fire.
    virtual void cancelOpen() = 0;
};

}  // namespace movehub
