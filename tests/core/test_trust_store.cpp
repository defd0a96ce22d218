// test_trust_store.cpp — Тесты постоянного хранилища сопряжённых устройств

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "oreonpickup/TrustStore.h"
#include "oreonpickup/Config.h"
#include "TestHelpers.h"
#include <fstream>
#include <thread>
#include <vector>

using namespace OreonPickup;
using json = nlohmann::json;
namespace fs = std::filesystem;

class TrustStoreTest : public ::testing::Test {
protected:
    std::string tempDir;
    std::string statePath;

    void SetUp() override {
        tempDir = OreonPickup::Test::makeTempDir("op_trust_test");
        statePath = tempDir + "/state.json";
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    static PairedDevice makeDevice(const std::string& host, const std::string& ip,
                                   uint16_t port = 50309, int64_t pairedAt = 1700000000) {
        PairedDevice device;
        device.deviceId = makeDeviceId(host, ip);
        device.hostname = host;
        device.ip = ip;
        device.port = port;
        device.pairedAt = pairedAt;
        return device;
    }

    void writeFile(const std::string& content) {
        std::ofstream file(statePath);
        file << content;
    }

    json readFile() {
        std::ifstream file(statePath);
        return json::parse(file);
    }
};

// ═══════════════════════════════════════════════════════════
// Load / Save
// ═══════════════════════════════════════════════════════════

TEST_F(TrustStoreTest, MissingFileLoadsEmpty) {
    TrustStore store(statePath);

    auto state = store.load();
    EXPECT_TRUE(state.pairedDevices.empty());
    EXPECT_TRUE(state.otherFields.empty());
    EXPECT_EQ(store.getLastErrorCode(), PickupError::None);
    EXPECT_FALSE(fs::exists(statePath));
}

TEST_F(TrustStoreTest, AddOrUpdateThenLoad) {
    TrustStore store(statePath);
    auto device = makeDevice("bob", "192.168.1.20");

    ASSERT_TRUE(store.addOrUpdate(device.deviceId, device));

    auto state = store.load();
    ASSERT_EQ(state.pairedDevices.size(), 1u);
    EXPECT_EQ(state.pairedDevices.at("bob@192.168.1.20"), device);

    // Формат файла
    auto j = readFile();
    ASSERT_TRUE(j["paired_devices"].is_object());
    const auto& entry = j["paired_devices"]["bob@192.168.1.20"];
    EXPECT_EQ(entry["hostname"], "bob");
    EXPECT_EQ(entry["ip"], "192.168.1.20");
    EXPECT_EQ(entry["port"], 50309);
    EXPECT_TRUE(entry["paired_at"].is_number_integer());
    EXPECT_EQ(entry["paired_at"], 1700000000);
}

TEST_F(TrustStoreTest, AddOrUpdateIsLastWriterWins) {
    TrustStore store(statePath);

    ASSERT_TRUE(store.addOrUpdate("bob@10.0.0.2", makeDevice("bob", "10.0.0.2", 50309, 100)));
    ASSERT_TRUE(store.addOrUpdate("bob@10.0.0.2", makeDevice("bob", "10.0.0.2", 50400, 200)));

    auto devices = store.list();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices.at("bob@10.0.0.2").port, 50400);
    EXPECT_EQ(devices.at("bob@10.0.0.2").pairedAt, 200);
}

TEST_F(TrustStoreTest, RemoveDeletesEntry) {
    TrustStore store(statePath);
    ASSERT_TRUE(store.addOrUpdate("bob@10.0.0.2", makeDevice("bob", "10.0.0.2")));
    ASSERT_TRUE(store.addOrUpdate("carol@10.0.0.3", makeDevice("carol", "10.0.0.3")));

    ASSERT_TRUE(store.remove("bob@10.0.0.2"));

    auto devices = store.load().pairedDevices;
    EXPECT_EQ(devices.count("bob@10.0.0.2"), 0u);
    EXPECT_EQ(devices.count("carol@10.0.0.3"), 1u);
    EXPECT_FALSE(store.isPaired("bob@10.0.0.2"));
}

TEST_F(TrustStoreTest, RemoveUnknownIdIsNoOp) {
    TrustStore store(statePath);
    ASSERT_TRUE(store.addOrUpdate("bob@10.0.0.2", makeDevice("bob", "10.0.0.2")));

    EXPECT_TRUE(store.remove("nobody@10.0.0.99"));
    EXPECT_EQ(store.list().size(), 1u);
}

TEST_F(TrustStoreTest, EmptyIdIsRejected) {
    TrustStore store(statePath);

    EXPECT_FALSE(store.addOrUpdate("", makeDevice("bob", "10.0.0.2")));
    EXPECT_EQ(store.getLastErrorCode(), PickupError::InvalidArgument);
    EXPECT_FALSE(fs::exists(statePath));
}

TEST_F(TrustStoreTest, GetReturnsRecord) {
    TrustStore store(statePath);
    auto device = makeDevice("bob", "10.0.0.2");
    ASSERT_TRUE(store.addOrUpdate(device.deviceId, device));

    auto found = store.get(device.deviceId);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, device);
    EXPECT_FALSE(store.get("missing@1.2.3.4").has_value());
}

// ═══════════════════════════════════════════════════════════
// Чужие поля и совместимость
// ═══════════════════════════════════════════════════════════

TEST_F(TrustStoreTest, UnknownTopLevelFieldsSurviveWrites) {
    writeFile(R"({
        "session_snapshot": {"apps": ["firefox", "konsole"], "taken_at": 1699999999.5},
        "theme": "dark",
        "paired_devices": {}
    })");

    TrustStore store(statePath);
    ASSERT_TRUE(store.addOrUpdate("bob@10.0.0.2", makeDevice("bob", "10.0.0.2")));
    ASSERT_TRUE(store.remove("bob@10.0.0.2"));

    auto j = readFile();
    EXPECT_EQ(j["theme"], "dark");
    EXPECT_EQ(j["session_snapshot"]["apps"], json({"firefox", "konsole"}));
    EXPECT_DOUBLE_EQ(j["session_snapshot"]["taken_at"].get<double>(), 1699999999.5);
    EXPECT_TRUE(j["paired_devices"].empty());

    auto state = store.load();
    EXPECT_EQ(state.otherFields.size(), 2u);
}

TEST_F(TrustStoreTest, SavePreservesOtherFields) {
    TrustStore store(statePath);

    TrustState state;
    state.otherFields["settings"] = R"({"sync":true})";
    state.pairedDevices["bob@10.0.0.2"] = makeDevice("bob", "10.0.0.2");
    ASSERT_TRUE(store.save(state));

    auto loaded = store.load();
    EXPECT_EQ(json::parse(loaded.otherFields.at("settings")), json::parse(R"({"sync":true})"));
    EXPECT_EQ(loaded.pairedDevices.size(), 1u);
}

TEST_F(TrustStoreTest, FractionalPairedAtIsAccepted) {
    writeFile(R"({"paired_devices": {"bob@10.0.0.2": {
        "hostname": "bob", "ip": "10.0.0.2", "port": 50309, "paired_at": 1700000000.75}}})");

    TrustStore store(statePath);
    auto devices = store.list();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices.at("bob@10.0.0.2").pairedAt, 1700000000);
}

TEST_F(TrustStoreTest, MissingFieldsAreRecoveredFromId) {
    writeFile(R"({"paired_devices": {"bob@10.0.0.2": {}}})");

    TrustStore store(statePath);
    auto device = store.get("bob@10.0.0.2");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->hostname, "bob");
    EXPECT_EQ(device->ip, "10.0.0.2");
    EXPECT_EQ(device->port, DEFAULT_PORT);
}

// ═══════════════════════════════════════════════════════════
// Ошибки
// ═══════════════════════════════════════════════════════════

TEST_F(TrustStoreTest, CorruptFileLoadsEmptyAndIsBackedUp) {
    writeFile("{ this is not json");

    TrustStore store(statePath);
    auto state = store.load();

    EXPECT_TRUE(state.pairedDevices.empty());
    EXPECT_EQ(store.getLastErrorCode(), PickupError::StorageIOError);
    EXPECT_TRUE(fs::exists(statePath + ".corrupt"));

    // Pairing после порчи файла всё ещё работает
    ASSERT_TRUE(store.addOrUpdate("bob@10.0.0.2", makeDevice("bob", "10.0.0.2")));
    EXPECT_EQ(store.list().size(), 1u);
}

TEST_F(TrustStoreTest, NonObjectFileIsCorrupt) {
    writeFile("[1, 2, 3]");

    TrustStore store(statePath);
    EXPECT_TRUE(store.list().empty());
    EXPECT_EQ(store.getLastErrorCode(), PickupError::StorageIOError);
}

TEST_F(TrustStoreTest, WriteFailureIsReported) {
    std::string fileAsDir = tempDir + "/plain_file";
    std::ofstream(fileAsDir) << "x";

    TrustStore store(fileAsDir + "/state.json");
    EXPECT_FALSE(store.addOrUpdate("bob@10.0.0.2", makeDevice("bob", "10.0.0.2")));
    EXPECT_EQ(store.getLastErrorCode(), PickupError::StorageIOError);
    EXPECT_FALSE(store.getLastError().empty());
}

TEST_F(TrustStoreTest, CreatesParentDirectories) {
    std::string nested = tempDir + "/a/b/c/state.json";
    TrustStore store(nested);

    ASSERT_TRUE(store.addOrUpdate("bob@10.0.0.2", makeDevice("bob", "10.0.0.2")));
    EXPECT_TRUE(fs::exists(nested));
    EXPECT_FALSE(fs::exists(nested + ".tmp"));
}

// ═══════════════════════════════════════════════════════════
// Конкурентность внутри процесса
// ═══════════════════════════════════════════════════════════

TEST_F(TrustStoreTest, ConcurrentWritersDoNotLoseUpdates) {
    // Два экземпляра на один путь делят один mutex
    TrustStore first(statePath);
    TrustStore second(statePath);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        TrustStore& store = (t % 2 == 0) ? first : second;
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < 10; ++i) {
                std::string host = "host" + std::to_string(t) + "_" + std::to_string(i);
                store.addOrUpdate(makeDeviceId(host, "10.0.0.1"), makeDevice(host, "10.0.0.1"));
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(first.list().size(), 40u);
}
