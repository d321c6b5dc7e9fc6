#include "registry/house.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "devices/socket_device.hpp"
#include "devices/thermometer_device.hpp"
#include "mocks/mock_entropy_source.hpp"

using namespace hearth;
using namespace testing;
using namespace hearth::tests;

class HouseTest : public Test {
protected:
    void SetUp() override { house = std::make_unique<registry::House>("H"); }

    std::shared_ptr<devices::SocketDevice> make_socket(const std::string &name) {
        return std::make_shared<devices::SocketDevice>(name, entropy);
    }

    std::shared_ptr<devices::ThermometerDevice> make_thermometer(const std::string &name) {
        return std::make_shared<devices::ThermometerDevice>(name, entropy);
    }

    bool add(const std::shared_ptr<devices::IDevice> &device, const std::string &room) {
        registry::HouseError error;
        return house->add_device_to_room(device, room, error);
    }

    std::vector<std::string> devices_in(const std::string &room) {
        std::vector<std::string> names;
        registry::HouseError error;
        EXPECT_TRUE(house->devices(room, names, error)) << error.message();
        return names;
    }

    std::shared_ptr<devices::IEntropySource> entropy = std::make_shared<devices::RandomEntropySource>(1234);
    std::unique_ptr<registry::House> house;
};

TEST_F(HouseTest, NewHouseIsEmpty) {
    EXPECT_EQ(house->name(), "H");
    EXPECT_TRUE(house->rooms().empty());
    EXPECT_EQ(house->device_count(), 0u);
    EXPECT_TRUE(house->sockets().empty());
}

TEST_F(HouseTest, AddCreatesRoomImplicitly) {
    ASSERT_TRUE(add(make_socket("A"), "bedroom"));

    EXPECT_THAT(house->rooms(), ElementsAre("bedroom"));
    EXPECT_THAT(devices_in("bedroom"), ElementsAre("A"));
}

TEST_F(HouseTest, DuplicateNameInRoomIsRejectedWithoutMutation) {
    auto original = make_socket("A");
    ASSERT_TRUE(add(original, "bedroom"));

    registry::HouseError error;
    EXPECT_FALSE(house->add_device_to_room(make_socket("A"), "bedroom", error));
    EXPECT_EQ(error.code, registry::ErrorCode::ALREADY_CONTAINS_DEVICE);
    EXPECT_EQ(error.subject, "A");
    EXPECT_EQ(error.message(), "The room already contains this device: A");

    EXPECT_THAT(devices_in("bedroom"), ElementsAre("A"));
    ASSERT_EQ(house->sockets().size(), 1u);
    EXPECT_EQ(house->sockets()[0], original);
    EXPECT_EQ(house->snapshot()["bedroom"][0], original);
}

TEST_F(HouseTest, SameNameAllowedInDifferentRooms) {
    EXPECT_TRUE(add(make_socket("A"), "bedroom"));
    EXPECT_TRUE(add(make_socket("A"), "kitchen"));

    EXPECT_THAT(house->rooms(), ElementsAre("bedroom", "kitchen"));
    EXPECT_EQ(house->sockets().size(), 2u);
}

TEST_F(HouseTest, DevicesOfUnknownRoomFails) {
    std::vector<std::string> names{"untouched"};
    registry::HouseError error;

    EXPECT_FALSE(house->devices("attic", names, error));
    EXPECT_EQ(error.code, registry::ErrorCode::NO_SUCH_ROOM);
    EXPECT_EQ(error.subject, "attic");
    EXPECT_EQ(error.message(), "The room ~=<attic>=~ does not exist");
    EXPECT_THAT(names, ElementsAre("untouched"));
}

TEST_F(HouseTest, DevicesAreIndexedByKind) {
    auto socket = make_socket("Plug");
    auto thermometer = make_thermometer("Thermo");
    ASSERT_TRUE(add(socket, "kitchen"));
    ASSERT_TRUE(add(thermometer, "kitchen"));

    ASSERT_EQ(house->sockets().size(), 1u);
    EXPECT_EQ(house->sockets()[0], socket);
    ASSERT_EQ(house->thermometers().size(), 1u);
    EXPECT_EQ(house->thermometers()[0], thermometer);
    EXPECT_THAT(devices_in("kitchen"), ElementsAre("Plug", "Thermo"));
}

TEST_F(HouseTest, RemoveRoomIsIdempotent) {
    ASSERT_TRUE(add(make_socket("A"), "bedroom"));
    ASSERT_TRUE(add(make_socket("B"), "kitchen"));

    house->remove_room("bedroom");
    EXPECT_THAT(house->rooms(), ElementsAre("kitchen"));

    house->remove_room("bedroom");
    EXPECT_THAT(house->rooms(), ElementsAre("kitchen"));

    house->remove_room("never-existed");
    EXPECT_THAT(house->rooms(), ElementsAre("kitchen"));
}

TEST_F(HouseTest, RemoveRoomPurgesItsDevicesFromIndex) {
    auto bedroom_socket = make_socket("A");
    auto kitchen_socket = make_socket("A");
    ASSERT_TRUE(add(bedroom_socket, "bedroom"));
    ASSERT_TRUE(add(kitchen_socket, "kitchen"));

    house->remove_room("bedroom");

    ASSERT_EQ(house->sockets().size(), 1u);
    EXPECT_EQ(house->sockets()[0], kitchen_socket);
}

TEST_F(HouseTest, RemoveRoomKeepsInstanceStillPlacedInAnotherRoom) {
    auto shared = make_socket("A");
    ASSERT_TRUE(add(shared, "bedroom"));
    ASSERT_TRUE(add(shared, "kitchen"));
    ASSERT_EQ(house->sockets().size(), 2u);

    house->remove_room("bedroom");

    EXPECT_THAT(house->rooms(), ElementsAre("kitchen"));
    EXPECT_EQ(house->snapshot()["kitchen"][0], shared);
    ASSERT_EQ(house->sockets().size(), 1u);
    EXPECT_EQ(house->sockets()[0], shared);

    house->remove_room("kitchen");
    EXPECT_TRUE(house->sockets().empty());
}

TEST_F(HouseTest, AddNullDeviceIsRejected) {
    registry::HouseError error;

    EXPECT_FALSE(house->add_device_to_room(nullptr, "bedroom", error));
    EXPECT_EQ(error.code, registry::ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(error.subject, "bedroom");
    EXPECT_TRUE(house->rooms().empty());
    EXPECT_TRUE(house->sockets().empty());
}

TEST_F(HouseTest, RemoveDeviceTargetsOnlyThatInstance) {
    auto bedroom_socket = make_socket("A");
    auto kitchen_socket = make_socket("A");
    ASSERT_TRUE(add(bedroom_socket, "bedroom"));
    ASSERT_TRUE(add(make_socket("B"), "bedroom"));
    ASSERT_TRUE(add(kitchen_socket, "kitchen"));

    house->remove_device_from_room("bedroom", bedroom_socket);

    EXPECT_THAT(devices_in("bedroom"), ElementsAre("B"));
    EXPECT_THAT(devices_in("kitchen"), ElementsAre("A"));
    EXPECT_EQ(house->snapshot()["kitchen"][0], kitchen_socket);

    auto sockets = house->sockets();
    EXPECT_EQ(sockets.size(), 2u);
    for (const auto &socket : sockets) {
        EXPECT_NE(socket, bedroom_socket);
    }
}

TEST_F(HouseTest, RemovingLastDeviceDropsRoom) {
    auto socket = make_socket("A");
    ASSERT_TRUE(add(socket, "bedroom"));

    house->remove_device_from_room("bedroom", socket);

    EXPECT_TRUE(house->rooms().empty());
    std::vector<std::string> names;
    registry::HouseError error;
    EXPECT_FALSE(house->devices("bedroom", names, error));
    EXPECT_EQ(error.code, registry::ErrorCode::NO_SUCH_ROOM);
    EXPECT_TRUE(house->sockets().empty());
}

TEST_F(HouseTest, RemoveDeviceFromMissingRoomOrMissingDeviceIsNoOp) {
    auto placed = make_socket("A");
    auto stray = make_socket("Z");
    ASSERT_TRUE(add(placed, "bedroom"));

    house->remove_device_from_room("attic", stray);
    house->remove_device_from_room("bedroom", stray);
    house->remove_device_from_room("bedroom", nullptr);

    EXPECT_THAT(devices_in("bedroom"), ElementsAre("A"));
    EXPECT_EQ(house->sockets().size(), 1u);
}

TEST_F(HouseTest, RemoveDeviceFromWrongRoomStillUnindexes) {
    auto socket = make_socket("A");
    ASSERT_TRUE(add(socket, "bedroom"));

    house->remove_device_from_room("kitchen", socket);

    EXPECT_THAT(devices_in("bedroom"), ElementsAre("A"));
    EXPECT_TRUE(house->sockets().empty());
}

TEST_F(HouseTest, PollAllRefreshesEveryDeviceInDomain) {
    std::vector<std::shared_ptr<devices::SocketDevice>> sockets;
    for (int i = 0; i < 4; ++i) {
        sockets.push_back(make_socket("S" + std::to_string(i)));
        ASSERT_TRUE(add(sockets.back(), i % 2 == 0 ? "bedroom" : "kitchen"));
    }
    auto thermometer = make_thermometer("T");
    ASSERT_TRUE(add(thermometer, "kitchen"));

    std::vector<double> before;
    for (const auto &socket : sockets) {
        before.push_back(socket->voltage());
    }

    house->poll_all();

    bool any_changed = false;
    for (size_t i = 0; i < sockets.size(); ++i) {
        EXPECT_GE(sockets[i]->voltage(), 0.0);
        EXPECT_LT(sockets[i]->voltage(), 380.0);
        any_changed = any_changed || sockets[i]->voltage() != before[i];
    }
    EXPECT_TRUE(any_changed);
    EXPECT_GE(thermometer->temperature(), -20.0);
    EXPECT_LT(thermometer->temperature(), 50.0);
}

TEST_F(HouseTest, PollAllCallsEntropyOncePerDevice) {
    auto counting = std::make_shared<SequenceEntropySource>(std::vector<double>{5.0});
    ASSERT_TRUE(add(std::make_shared<devices::SocketDevice>("A", counting), "bedroom"));
    ASSERT_TRUE(add(std::make_shared<devices::SocketDevice>("B", counting), "kitchen"));
    ASSERT_EQ(counting->calls, 2u);

    house->poll_all();

    EXPECT_EQ(counting->calls, 4u);
}

TEST_F(HouseTest, DescribeListsRoomsAndDevicesInNameOrder) {
    auto fixed = std::make_shared<SequenceEntropySource>(std::vector<double>{1.0, 2.0, 3.0});
    ASSERT_TRUE(add(std::make_shared<devices::SocketDevice>("B", fixed), "kitchen"));
    ASSERT_TRUE(add(std::make_shared<devices::SocketDevice>("Z", fixed), "bedroom"));
    ASSERT_TRUE(add(std::make_shared<devices::ThermometerDevice>("A", fixed), "bedroom"));

    std::string expected =
        "House «H»:\n"
        "bedroom\n"
        "THERMOMETER:\n    name: A\n    temperature: 3.00\n"
        "SOCKET:\n    name: Z\n    voltage: 2.00\n"
        "kitchen\n"
        "SOCKET:\n    name: B\n    voltage: 1.00\n";
    EXPECT_EQ(house->describe(), expected);

    std::ostringstream out;
    out << *house;
    EXPECT_EQ(out.str(), expected);
}

// Walkthrough: add, reject duplicate, list, remove room
TEST_F(HouseTest, EndToEndScenario) {
    registry::HouseError error;

    EXPECT_TRUE(house->add_device_to_room(make_socket("A"), "bedroom", error));
    EXPECT_TRUE(house->add_device_to_room(make_socket("B"), "bedroom", error));

    EXPECT_FALSE(house->add_device_to_room(make_socket("A"), "bedroom", error));
    EXPECT_EQ(error.code, registry::ErrorCode::ALREADY_CONTAINS_DEVICE);
    EXPECT_EQ(error.subject, "A");

    EXPECT_THAT(devices_in("bedroom"), UnorderedElementsAre("A", "B"));
    EXPECT_THAT(house->rooms(), ElementsAre("bedroom"));

    house->remove_room("bedroom");
    EXPECT_TRUE(house->rooms().empty());

    std::vector<std::string> names;
    EXPECT_FALSE(house->devices("bedroom", names, error));
    EXPECT_EQ(error.code, registry::ErrorCode::NO_SUCH_ROOM);
    EXPECT_EQ(error.subject, "bedroom");
}

TEST(HouseErrorTest, CodesToString) {
    EXPECT_EQ(registry::error_code_to_string(registry::ErrorCode::NONE), "NONE");
    EXPECT_EQ(registry::error_code_to_string(registry::ErrorCode::NO_SUCH_ROOM), "NO_SUCH_ROOM");
    EXPECT_EQ(registry::error_code_to_string(registry::ErrorCode::ALREADY_CONTAINS_DEVICE),
              "ALREADY_CONTAINS_DEVICE");
    EXPECT_EQ(registry::error_code_to_string(registry::ErrorCode::INVALID_ARGUMENT), "INVALID_ARGUMENT");
    EXPECT_EQ(registry::HouseError{}.message(), "");
}
