#pragma once
#include "ble/BleAdapter.hpp"
#include <map>
#include <memory>
#include <string>

namespace sdbus { class IConnection; class Variant; class ObjectPath; } // fwd decl

// BleAdapter on top of BlueZ (org.bluez over the D-Bus system bus).
// Notifications arrive on the sdbus event loop thread.
class BlueZAdapter : public BleAdapter {
public:
    // adapter: controller name under /org/bluez, e.g. "hci0".
    BlueZAdapter(const std::string& adapter, std::chrono::milliseconds connectTimeout);
    ~BlueZAdapter() override;

    BlueZAdapter(const BlueZAdapter&) = delete;
    BlueZAdapter& operator=(const BlueZAdapter&) = delete;

    // Opens the system bus. Throws ConnectError; scan() retries it.
    void init();

    std::optional<DeviceHandle> scan(const std::string& pattern,
                                     std::chrono::milliseconds timeout,
                                     const StopSignal& stop) override;
    std::unique_ptr<GattLink> connect(const DeviceHandle& device, const StopSignal& stop) override;
    std::unique_ptr<NotificationStream> subscribe(GattLink& link,
                                                  const std::string& characteristicUuid) override;
    void disconnect(GattLink& link) override;

private:
    using ManagedObjects =
        std::map<sdbus::ObjectPath, std::map<std::string, std::map<std::string, sdbus::Variant>>>;

    ManagedObjects managedObjects();
    std::optional<DeviceHandle> findHeartRateDevice(const std::string& pattern);

    // --- BlueZ helpers ---
    // returns empty string on failure
    std::string findServicePathByUuid(const std::string& devicePath,
                                      const std::string& serviceUuid);
    std::string findCharPathByUuid(const std::string& devicePath,
                                   const std::string& servicePath,
                                   const std::string& charUuid);

    void ensureConnection();
    // Throws ConnectError if the adapter is missing or powered off.
    void ensureAdapterReady();
    void startDiscovery();
    void stopDiscovery();
    bool servicesResolved(const std::string& devicePath);

    std::string adapter_;
    std::string adapterPath_;
    std::chrono::milliseconds connectTimeout_;
    std::unique_ptr<sdbus::IConnection> connection_;
};
