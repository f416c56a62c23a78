#include "NimBleLink.h"

#ifdef ARDUINO

#include <utility>

#include "Config.h"
#include "system/Log.h"

namespace movehub {

void NimBleClientCallbacks::disarm() {
    std::lock_guard<std::mutex> lock(mutex_);
    onDrop_ = nullptr;
}

void NimBleClientCallbacks::onDisconnect(NimBLEClient* client, int reason) {
    LinkProvider::DropCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = onDrop_;
    }
    system::logf("BLE", "Client %s disconnected, reason=%d", client->getPeerAddress().toString().c_str(), reason);
    if (cb) {
        cb("BLE disconnect, reason " + std::to_string(reason));
    }
}

NimBleLink::NimBleLink(NimBLEClient* client, NimBleClientCallbacks* callbacks, NimBLERemoteCharacteristic* command,
                       NimBLERemoteCharacteristic* notify, std::string name)
    : client_(client), callbacks_(callbacks), command_(command), notify_(notify), name_(std::move(name)) {}

NimBleLink::~NimBleLink() {
    close();
}

void NimBleLink::write(const std::vector<uint8_t>& bytes, CompletionCallback done) {
    if (closed_ || command_ == nullptr) {
        done(false, "link closed");
        return;
    }
    if (!command_->writeValue(bytes.data(), bytes.size(), true)) {
        done(false, "GATT write failed");
        return;
    }
    done(true, std::string());
}

void NimBleLink::subscribe(FrameCallback onFrame, CompletionCallback done) {
    if (closed_ || notify_ == nullptr || !notify_->canNotify()) {
        done(false, "notify characteristic unavailable");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(frameMutex_);
        onFrame_ = std::move(onFrame);
    }
    const bool ok = notify_->subscribe(true, [this](NimBLERemoteCharacteristic*, uint8_t* data, size_t length, bool) {
        std::lock_guard<std::mutex> lock(frameMutex_);
        if (!closed_ && onFrame_) {
            onFrame_(data, length);
        }
    });
    done(ok, ok ? std::string() : std::string("notify subscribe failed"));
}

void NimBleLink::close() {
    {
        std::lock_guard<std::mutex> lock(frameMutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        onFrame_ = nullptr;
    }
    if (callbacks_ != nullptr) {
        callbacks_->disarm();
        callbacks_ = nullptr;
    }
    if (client_ != nullptr) {
        if (notify_ != nullptr) {
            notify_->unsubscribe();
        }
        client_->disconnect();
        NimBLEDevice::deleteClient(client_);
        client_ = nullptr;
    }
}

void NimBleTransport::open(const LinkTarget& target, DropCallback onDrop, OpenCallback done) {
    system::logf("BLE", "Scanning %u ms for %s*", static_cast<unsigned>(SCAN_DURATION_MS), target.namePrefix.c_str());
    NimBLEScan* scan = NimBLEDevice::getScan();
    scan->setActiveScan(true);
    NimBLEScanResults results = scan->getResults(SCAN_DURATION_MS, false);

    const NimBLEAdvertisedDevice* found = nullptr;
    for (int i = 0; i < results.getCount(); ++i) {
        const NimBLEAdvertisedDevice* device = results.getDevice(i);
        if (device != nullptr && device->getName().rfind(target.namePrefix, 0) == 0) {
            found = device;
            break;
        }
    }
    if (found == nullptr) {
        done(nullptr, "No " + target.namePrefix + " device found");
        return;
    }

    const std::string name = found->getName();
    NimBLEClient* client = NimBLEDevice::createClient();
    if (client == nullptr) {
        done(nullptr, "Out of BLE clients");
        return;
    }
    // Deleted together with the client
    auto* callbacks = new NimBleClientCallbacks(std::move(onDrop));
    client->setClientCallbacks(callbacks, true);

    if (!client->connect(found)) {
        callbacks->disarm();
        NimBLEDevice::deleteClient(client);
        done(nullptr, "GATT connect to " + name + " failed");
        return;
    }

    NimBLERemoteService* service = client->getService(target.serviceUuid);
    NimBLERemoteCharacteristic* command = service ? service->getCharacteristic(target.commandCharUuid) : nullptr;
    NimBLERemoteCharacteristic* notify = service ? service->getCharacteristic(target.notifyCharUuid) : nullptr;
    if (command == nullptr || notify == nullptr) {
        callbacks->disarm();
        client->disconnect();
        NimBLEDevice::deleteClient(client);
        done(nullptr, service ? "Movesense characteristics missing" : "Movesense service missing");
        return;
    }

    system::logf("BLE", "Connected to %s", name.c_str());
    done(std::make_unique<NimBleLink>(client, callbacks, command, notify, name), std::string());
}

}  // namespace movehub

#endif  // ARDUINO
