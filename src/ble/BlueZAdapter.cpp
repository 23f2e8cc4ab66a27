#include "ble/BlueZAdapter.hpp"
#include "app/Errors.hpp"
#include "app/StopSignal.hpp"
#include "ble/NotificationMailbox.hpp"
#include <sdbus-c++/sdbus-c++.h>
#include <future>
#include <iostream>
#include <strings.h>
#include <vector>

using namespace std::chrono_literals;

namespace {

constexpr const char* kBluez = "org.bluez";
constexpr const char* kAdapterIface = "org.bluez.Adapter1";
constexpr const char* kDeviceIface = "org.bluez.Device1";
constexpr const char* kServiceIface = "org.bluez.GattService1";
constexpr const char* kCharIface = "org.bluez.GattCharacteristic1";
constexpr const char* kPropsIface = "org.freedesktop.DBus.Properties";

constexpr auto kScanPoll = 250ms;

bool uuidEquals(const std::string& a, const std::string& b) {
    return !a.empty() && strcasecmp(a.c_str(), b.c_str()) == 0;
}

template <class T>
std::optional<T> prop(const std::map<std::string, sdbus::Variant>& props, const std::string& key) {
    auto it = props.find(key);
    if (it == props.end() || !it->second.containsValueOfType<T>()) return std::nullopt;
    return it->second.get<T>();
}

class BlueZLink : public GattLink {
public:
    BlueZLink(DeviceHandle device, std::unique_ptr<sdbus::IProxy> proxy)
        : device_(std::move(device)), proxy_(std::move(proxy)) {}

    const DeviceHandle& device() const override { return device_; }
    sdbus::IProxy& proxy() { return *proxy_; }

private:
    DeviceHandle device_;
    std::unique_ptr<sdbus::IProxy> proxy_;
};

class BlueZNotificationStream : public NotificationStream {
public:
    BlueZNotificationStream(sdbus::IConnection& conn,
                            const std::string& devicePath,
                            const std::string& charPath)
        : charPath_(charPath), mailbox_(std::make_shared<NotificationMailbox>()) {
        charProxy_ = sdbus::createProxy(conn, sdbus::ServiceName(kBluez), sdbus::ObjectPath(charPath));
        deviceProxy_ = sdbus::createProxy(conn, sdbus::ServiceName(kBluez), sdbus::ObjectPath(devicePath));

        auto box = mailbox_;
        charProxy_->uponSignal("PropertiesChanged")
            .onInterface(kPropsIface)
            .call([box](const std::string& iface,
                        const std::map<std::string, sdbus::Variant>& changed,
                        const std::vector<std::string>& /*invalidated*/) {
                if (iface != kCharIface) return;
                if (auto value = prop<std::vector<uint8_t>>(changed, "Value")) {
                    if (!box->push(std::move(*value))) {
                        std::cerr << "[ble] unread notification replaced by a newer one\n";
                    }
                }
            });

        deviceProxy_->uponSignal("PropertiesChanged")
            .onInterface(kPropsIface)
            .call([box](const std::string& iface,
                        const std::map<std::string, sdbus::Variant>& changed,
                        const std::vector<std::string>& /*invalidated*/) {
                if (iface != kDeviceIface) return;
                auto connected = prop<bool>(changed, "Connected");
                if (connected && !*connected) {
                    std::cout << "[ble] device reported disconnect\n";
                    box->end(EndReason::DeviceDisconnected);
                }
            });

        charProxy_->callMethod("StartNotify").onInterface(kCharIface);
        notifying_ = true;
        std::cout << "[ble] notifications enabled on " << charPath_ << "\n";
    }

    ~BlueZNotificationStream() override {
        mailbox_->end(EndReason::StreamClosed);
        if (!notifying_) return;
        try {
            charProxy_->callMethod("StopNotify").onInterface(kCharIface);
        } catch (const sdbus::Error& e) {
            // expected when the device is already gone
            std::cerr << "[ble] StopNotify: " << e.getName() << " " << e.getMessage() << "\n";
        }
    }

    Status next(std::vector<uint8_t>& frame, std::chrono::milliseconds waitFor) override {
        return mailbox_->next(frame, waitFor);
    }

    EndReason endReason() const override { return mailbox_->endReason(); }

private:
    std::string charPath_;
    std::shared_ptr<NotificationMailbox> mailbox_;
    std::unique_ptr<sdbus::IProxy> charProxy_;
    std::unique_ptr<sdbus::IProxy> deviceProxy_;
    bool notifying_ = false;
};

} // namespace

BlueZAdapter::BlueZAdapter(const std::string& adapter, std::chrono::milliseconds connectTimeout)
    : adapter_(adapter), adapterPath_("/org/bluez/" + adapter), connectTimeout_(connectTimeout) {}

BlueZAdapter::~BlueZAdapter() {
    if (connection_) connection_->leaveEventLoop();
}

void BlueZAdapter::init() {
    ensureConnection();
    std::cout << "[ble] system bus connected, adapter=" << adapter_ << "\n";
}

void BlueZAdapter::ensureConnection() {
    if (connection_) return;
    try {
        connection_ = sdbus::createSystemBusConnection();
        connection_->enterEventLoopAsync();
    } catch (const sdbus::Error& e) {
        connection_.reset();
        throw ConnectError("system bus unavailable: " + e.getName() + " " + e.getMessage());
    }
}

void BlueZAdapter::ensureAdapterReady() {
    ensureConnection();

    auto adapterProxy = sdbus::createProxy(*connection_, sdbus::ServiceName(kBluez),
                                           sdbus::ObjectPath(adapterPath_));
    sdbus::Variant powered;
    try {
        adapterProxy->callMethod("Get")
            .onInterface(kPropsIface)
            .withArguments(std::string(kAdapterIface), std::string("Powered"))
            .storeResultsTo(powered);
    } catch (const sdbus::Error& e) {
        throw ConnectError("bluetooth adapter " + adapterPath_ + " unavailable: " + e.getMessage());
    }
    if (!powered.containsValueOfType<bool>() || !powered.get<bool>()) {
        throw ConnectError("bluetooth adapter " + adapterPath_ + " is powered off");
    }
}

BlueZAdapter::ManagedObjects BlueZAdapter::managedObjects() {
    auto om = sdbus::createProxy(*connection_, sdbus::ServiceName(kBluez), sdbus::ObjectPath("/"));
    // GetManagedObjects returns: map<objectPath, map<interface, map<property, variant>>>
    ManagedObjects objs;
    om->callMethod("GetManagedObjects")
      .onInterface("org.freedesktop.DBus.ObjectManager")
      .storeResultsTo(objs);
    return objs;
}

void BlueZAdapter::startDiscovery() {
    auto adapterProxy = sdbus::createProxy(*connection_, sdbus::ServiceName(kBluez),
                                           sdbus::ObjectPath(adapterPath_));

    std::map<std::string, sdbus::Variant> filter;
    filter["UUIDs"] = sdbus::Variant(std::vector<std::string>{kHeartRateServiceUuid});
    filter["Transport"] = sdbus::Variant(std::string("le"));
    adapterProxy->callMethod("SetDiscoveryFilter").onInterface(kAdapterIface).withArguments(filter);

    try {
        adapterProxy->callMethod("StartDiscovery").onInterface(kAdapterIface);
    } catch (const sdbus::Error& e) {
        // InProgress means another client is already scanning, which is fine
        if (e.getName() != "org.bluez.Error.InProgress") throw;
    }
}

void BlueZAdapter::stopDiscovery() {
    auto adapterProxy = sdbus::createProxy(*connection_, sdbus::ServiceName(kBluez),
                                           sdbus::ObjectPath(adapterPath_));
    try {
        adapterProxy->callMethod("StopDiscovery").onInterface(kAdapterIface);
    } catch (const sdbus::Error& e) {
        std::cerr << "[ble] StopDiscovery: " << e.getName() << " " << e.getMessage() << "\n";
    }
}

std::optional<DeviceHandle> BlueZAdapter::findHeartRateDevice(const std::string& pattern) {
    const std::string prefix = adapterPath_ + "/";
    for (const auto& [objPath, ifaces] : managedObjects()) {
        const std::string pathStr = static_cast<std::string>(objPath);
        if (pathStr.rfind(prefix, 0) != 0) continue;

        auto it = ifaces.find(kDeviceIface);
        if (it == ifaces.end()) continue;
        const auto& props = it->second;

        // only devices seen during this discovery or already connected
        const bool present = props.count("RSSI") != 0 || prop<bool>(props, "Connected").value_or(false);
        if (!present) continue;

        const auto uuids = prop<std::vector<std::string>>(props, "UUIDs").value_or(std::vector<std::string>{});
        bool heartRate = false;
        for (const auto& u : uuids) heartRate = heartRate || uuidEquals(u, kHeartRateServiceUuid);
        if (!heartRate) continue;

        DeviceHandle dev;
        dev.address = prop<std::string>(props, "Address").value_or("");
        dev.name = prop<std::string>(props, "Name").value_or(prop<std::string>(props, "Alias").value_or(""));
        dev.objectPath = pathStr;
        if (deviceMatches(dev, pattern)) return dev;
    }
    return std::nullopt;
}

std::optional<DeviceHandle> BlueZAdapter::scan(const std::string& pattern,
                                               std::chrono::milliseconds timeout,
                                               const StopSignal& stop) {
    ensureAdapterReady();

    std::cout << "[ble] scanning for heart rate sensors"
              << (pattern.empty() ? "" : " matching '" + pattern + "'") << "...\n";
    try {
        startDiscovery();
    } catch (const sdbus::Error& e) {
        std::cerr << "[ble] StartDiscovery: " << e.getName() << " " << e.getMessage() << "\n";
        return std::nullopt;
    }

    std::optional<DeviceHandle> found;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    try {
        while (!found && std::chrono::steady_clock::now() < deadline) {
            found = findHeartRateDevice(pattern);
            if (found || stop.waitFor(kScanPoll)) break;
        }
    } catch (const sdbus::Error& e) {
        std::cerr << "[ble] scan error: " << e.getName() << " " << e.getMessage() << "\n";
    }
    stopDiscovery();

    if (found) {
        std::cout << "[ble] found " << (found->name.empty() ? "(unnamed)" : found->name)
                  << " at " << found->address << "\n";
    } else {
        std::cout << "[ble] no heart rate sensor found\n";
    }
    return found;
}

bool BlueZAdapter::servicesResolved(const std::string& devicePath) {
    auto dev = sdbus::createProxy(*connection_, sdbus::ServiceName(kBluez), sdbus::ObjectPath(devicePath));
    sdbus::Variant resolved;
    dev->callMethod("Get")
        .onInterface(kPropsIface)
        .withArguments(std::string(kDeviceIface), std::string("ServicesResolved"))
        .storeResultsTo(resolved);
    return resolved.get<bool>();
}

std::unique_ptr<GattLink> BlueZAdapter::connect(const DeviceHandle& device, const StopSignal& stop) {
    std::cout << "[ble] Connecting to " << device.objectPath << "...\n";
    auto dev = sdbus::createProxy(*connection_, sdbus::ServiceName(kBluez), sdbus::ObjectPath(device.objectPath));
    auto link = std::make_unique<BlueZLink>(device, std::move(dev));

    const auto deadline = std::chrono::steady_clock::now() + connectTimeout_;
    try {
        std::future<void> reply = link->proxy().callMethodAsync("Connect")
                                      .onInterface(kDeviceIface)
                                      .withTimeout(connectTimeout_)
                                      .getResultAsFuture<>();
        while (reply.wait_for(kScanPoll) != std::future_status::ready) {
            if (stop.stopRequested()) {
                // caller releases the link, which aborts the pending connect
                std::cout << "[ble] connect interrupted\n";
                return link;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                disconnect(*link);
                throw ConnectError("Connect " + device.address + ": no reply within " +
                                   std::to_string(connectTimeout_.count()) + " ms");
            }
        }
        reply.get();
    } catch (const sdbus::Error& e) {
        if (e.getName() != "org.bluez.Error.AlreadyConnected") {
            // BlueZ may keep connecting in the background after a D-Bus timeout
            disconnect(*link);
            throw ConnectError("Connect " + device.address + ": " + e.getName() + " " + e.getMessage());
        }
    }

    // Wait until GATT services are resolved
    try {
        while (!servicesResolved(device.objectPath)) {
            if (std::chrono::steady_clock::now() >= deadline) {
                disconnect(*link);
                throw ConnectError("services of " + device.address + " not resolved within " +
                                   std::to_string(connectTimeout_.count()) + " ms");
            }
            if (stop.waitFor(kScanPoll)) break;
        }
    } catch (const sdbus::Error& e) {
        disconnect(*link);
        throw ConnectError("ServicesResolved " + device.address + ": " + e.getName() + " " + e.getMessage());
    }

    std::cout << "[ble] connected\n";
    return link;
}

// Explore BlueZ object tree and find the service path whose UUID matches.
std::string BlueZAdapter::findServicePathByUuid(const std::string& devicePath,
                                                const std::string& serviceUuid) {
    for (const auto& [objPath, ifaces] : managedObjects()) {
        const std::string pathStr = static_cast<std::string>(objPath);
        // Restrict search to under this device
        if (pathStr.rfind(devicePath + "/", 0) != 0) continue;

        auto it = ifaces.find(kServiceIface);
        if (it == ifaces.end()) continue;

        if (uuidEquals(prop<std::string>(it->second, "UUID").value_or(""), serviceUuid)) {
            return pathStr;
        }
    }
    return {};
}

std::string BlueZAdapter::findCharPathByUuid(const std::string& devicePath,
                                             const std::string& servicePath,
                                             const std::string& charUuid) {
    for (const auto& [objPath, ifaces] : managedObjects()) {
        const std::string pathStr = static_cast<std::string>(objPath);
        // Must be under devicePath and belong to this service subtree
        if (pathStr.rfind(devicePath + "/", 0) != 0) continue;
        if (pathStr.rfind(servicePath + "/", 0) != 0) continue;

        auto it = ifaces.find(kCharIface);
        if (it == ifaces.end()) continue;

        if (uuidEquals(prop<std::string>(it->second, "UUID").value_or(""), charUuid)) {
            return pathStr;
        }
    }
    return {};
}

std::unique_ptr<NotificationStream> BlueZAdapter::subscribe(GattLink& link,
                                                            const std::string& characteristicUuid) {
    const DeviceHandle& dev = link.device();
    try {
        const std::string servicePath = findServicePathByUuid(dev.objectPath, kHeartRateServiceUuid);
        if (servicePath.empty()) {
            throw ConnectError("heart rate service not found on " + dev.address);
        }
        const std::string charPath = findCharPathByUuid(dev.objectPath, servicePath, characteristicUuid);
        if (charPath.empty()) {
            throw ConnectError("characteristic " + characteristicUuid + " not found on " + dev.address);
        }
        std::cout << "[ble] char path = " << charPath << "\n";
        return std::make_unique<BlueZNotificationStream>(*connection_, dev.objectPath, charPath);
    } catch (const sdbus::Error& e) {
        throw ConnectError("subscribe " + dev.address + ": " + e.getName() + " " + e.getMessage());
    }
}

void BlueZAdapter::disconnect(GattLink& link) {
    auto* bluez = dynamic_cast<BlueZLink*>(&link);
    if (!bluez) {
        std::cerr << "[ble] disconnect: foreign link ignored\n";
        return;
    }
    try {
        bluez->proxy().callMethod("Disconnect").onInterface(kDeviceIface);
        std::cout << "[ble] disconnected " << link.device().address << "\n";
    } catch (const sdbus::Error& e) {
        std::cerr << "[ble] Disconnect: " << e.getName() << " " << e.getMessage() << "\n";
    }
}
