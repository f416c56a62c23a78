#pragma once

#ifdef ARDUINO

#include <NimBLEDevice.h>

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "Link.h"

namespace movehub {

/**
 * @brief Disconnect listener bound to one client and one open() call.
 *
 * The client owns it. disarm() stops a late disconnect from reporting a drop
 * for a link that was already closed on purpose.
 */
class NimBleClientCallbacks : public NimBLEClientCallbacks {
public:
    explicit NimBleClientCallbacks(LinkProvider::DropCallback onDrop) : onDrop_(std::move(onDrop)) {}

    void disarm();
    void onDisconnect(NimBLEClient* client, int reason) override;

private:
    std::mutex mutex_;
    LinkProvider::DropCallback onDrop_;
};

/**
 * @brief Link over a NimBLE client connection.
 *
 * Writes go to the command characteristic with response, so they complete
 * inline on the caller's thread. Notifications arrive on the NimBLE host
 * task and are forwarded as they come.
 */
class NimBleLink : public Link {
public:
    NimBleLink(NimBLEClient* client, NimBleClientCallbacks* callbacks, NimBLERemoteCharacteristic* command,
               NimBLERemoteCharacteristic* notify, std::string name);
    ~NimBleLink() override;

    void write(const std::vector<uint8_t>& bytes, CompletionCallback done) override;
    void subscribe(FrameCallback onFrame, CompletionCallback done) override;
    void close() override;
    std::string name() const override { return name_; }

private:
    NimBLEClient* client_;
    NimBleClientCallbacks* callbacks_;
    NimBLERemoteCharacteristic* command_;
    NimBLERemoteCharacteristic* notify_;
    std::string name_;

    std::mutex frameMutex_;
    FrameCallback onFrame_;
    bool closed_ = false;
};

/**
 * @brief Scans for the first device whose advertised name starts with the
 * target prefix and opens its Movesense service.
 *
 * open() blocks for the scan window plus the GATT connect; it completes
 * before returning. Each client gets its own NimBleClientCallbacks holding
 * the drop callback of the open() that created it.
 */
class NimBleTransport : public LinkProvider {
public:
    void open(const LinkTarget& target, DropCallback onDrop, OpenCallback done) override;
    void cancelOpen() override {}
};

}  // namespace movehub

#endif  // ARDUINO
