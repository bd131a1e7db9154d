#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <openxr/openxr.h>

#include <future>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../../src/core/anchor_interaction_controller.h"
#include "../../src/core/ianchor_subsystem.h"
#include "../../src/core/igesture_input.h"
#include "../../src/core/iscene_host.h"
#include "../../src/core/pose_math.h"

namespace xanchor {
namespace test {

using core::AnchorHandle;

/**
 * GMock mocks for the controller's collaborators
 *
 * These replace the platform anchor subsystem, input and scene so the controller logic can be
 * exercised without a provider library.
 */
class MockAnchorStore : public core::IAnchorStore {
   public:
    MOCK_METHOD(std::vector<std::string>, EnumeratePersistedNames, (), (override));
    MOCK_METHOD(AnchorHandle, LoadAnchor, (const std::string&), (override));
    MOCK_METHOD(XrResult, PersistAnchor, (AnchorHandle, const std::string&), (override));
    MOCK_METHOD(XrResult, UnpersistAnchor, (const std::string&), (override));

    static void SetupDefaultBehaviors(MockAnchorStore* mock) {
        ON_CALL(*mock, EnumeratePersistedNames()).WillByDefault(testing::Return(std::vector<std::string>{}));
        ON_CALL(*mock, LoadAnchor(testing::_)).WillByDefault(testing::Return(core::XA_NULL_ANCHOR));
        ON_CALL(*mock, PersistAnchor(testing::_, testing::_)).WillByDefault(testing::Return(XR_SUCCESS));
        ON_CALL(*mock, UnpersistAnchor(testing::_)).WillByDefault(testing::Return(XR_SUCCESS));
    }
};

class MockAnchorSubsystem : public core::IAnchorSubsystem {
   public:
    MOCK_METHOD(bool, IsAvailable, (), (const, override));
    MOCK_METHOD(XrResult, CreateAnchor, (const XrPosef&, AnchorHandle&), (override));
    MOCK_METHOD((std::future<std::shared_ptr<core::IAnchorStore>>), LoadStoreAsync, (), (override));
    MOCK_METHOD(uint64_t, RegisterAnchorsChangedCallback, (core::AnchorsChangedCallback), (override));
    MOCK_METHOD(void, UnregisterAnchorsChangedCallback, (uint64_t), (override));
};

class MockGestureInput : public core::IGestureInput {
   public:
    MOCK_METHOD(bool, GetInputStateBoolean, (const char*, const char*, XrBool32&), (override));
    MOCK_METHOD(bool, GetDevicePosition, (const char*, XrVector3f&), (override));
};

class MockSceneHost : public core::ISceneHost {
   public:
    MOCK_METHOD(void, SpawnAnchorVisual, (const core::AnchorRecord&), (override));
    MOCK_METHOD(void, UpdateAnchorVisual, (const core::AnchorRecord&), (override));
    MOCK_METHOD(void, DestroyAnchorVisual, (AnchorHandle), (override));
};

inline core::AnchorChange MakeChange(AnchorHandle handle, XrVector3f position,
                                     core::TrackingState state = core::TrackingState::TRACKING) {
    core::AnchorChange change;
    change.handle = handle;
    change.pose = core::MakePose(position, XrQuaternionf{0.0f, 0.0f, 0.0f, 1.0f});
    change.pose_valid = true;
    change.tracking_state = state;
    return change;
}

}  // namespace test
}  // namespace xanchor

using xanchor::core::AnchorHandle;

// Fixture wiring the mocks into a controller. Gesture and device state live in plain maps so tests
// can drive ticks without restating expectations.
class ControllerTestBase : public ::testing::Test {
   protected:
    static constexpr uint64_t kRegistration = 7;

    void SetUp() override {
        subsystem = std::make_unique<testing::NiceMock<xanchor::test::MockAnchorSubsystem>>();
        input = std::make_unique<testing::NiceMock<xanchor::test::MockGestureInput>>();
        scene = std::make_unique<testing::NiceMock<xanchor::test::MockSceneHost>>();
        store = std::make_shared<testing::NiceMock<xanchor::test::MockAnchorStore>>();
        xanchor::test::MockAnchorStore::SetupDefaultBehaviors(store.get());

        config.name_seed = 42;

        ON_CALL(*subsystem, IsAvailable()).WillByDefault(testing::Return(true));
        ON_CALL(*subsystem, CreateAnchor(testing::_, testing::_))
            .WillByDefault(testing::Invoke([this](const XrPosef& pose, AnchorHandle& out_handle) {
                created_poses.push_back(pose);
                out_handle = next_handle++;
                return XR_SUCCESS;
            }));
        ON_CALL(*subsystem, LoadStoreAsync()).WillByDefault(testing::Invoke([this]() {
            store_promise = std::promise<std::shared_ptr<xanchor::core::IAnchorStore>>();
            return store_promise.get_future();
        }));
        ON_CALL(*subsystem, RegisterAnchorsChangedCallback(testing::_))
            .WillByDefault(testing::Invoke([this](xanchor::core::AnchorsChangedCallback callback) {
                anchors_changed = std::move(callback);
                return kRegistration;
            }));
        ON_CALL(*subsystem, UnregisterAnchorsChangedCallback(testing::_))
            .WillByDefault(testing::Invoke([this](uint64_t) { anchors_changed = nullptr; }));

        ON_CALL(*input, GetInputStateBoolean(testing::_, testing::_, testing::_))
            .WillByDefault(testing::Invoke([this](const char* user_path, const char* component, XrBool32& out) {
                auto it = buttons.find(std::string(user_path) + component);
                if (it == buttons.end()) {
                    return false;
                }
                out = it->second ? XR_TRUE : XR_FALSE;
                return true;
            }));
        ON_CALL(*input, GetDevicePosition(testing::_, testing::_))
            .WillByDefault(testing::Invoke([this](const char* user_path, XrVector3f& out) {
                auto it = positions.find(user_path);
                if (it == positions.end()) {
                    return false;
                }
                out = it->second;
                return true;
            }));
    }

    void TearDown() override {
        // Controller first: its teardown unregisters from the subsystem
        controller.reset();
        store.reset();
    }

    xanchor::core::AnchorInteractionController& CreateController() {
        controller = std::make_unique<xanchor::core::AnchorInteractionController>(subsystem.get(), input.get(),
                                                                                  scene.get(), config);
        controller->SetErrorCallback([this](xanchor::core::AnchorError error, const std::string&) {
            errors.push_back(error);
        });
        return *controller;
    }

    // Initialize, resolve the store and run one tick to reach READY
    xanchor::core::AnchorInteractionController& CreateReadyController(bool with_store = true) {
        CreateController();
        EXPECT_EQ(controller->Initialize(), XR_SUCCESS);
        ResolveStore(with_store ? store : nullptr);
        controller->Tick();
        EXPECT_EQ(controller->GetState(), xanchor::core::ControllerState::READY);
        return *controller;
    }

    void ResolveStore(std::shared_ptr<xanchor::core::IAnchorStore> resolved) {
        store_promise.set_value(std::move(resolved));
    }

    void Fire(const xanchor::core::AnchorsChangedEvent& event) {
        ASSERT_TRUE(anchors_changed != nullptr) << "Controller is not subscribed";
        anchors_changed(event);
    }

    void SetButton(const std::string& user_path, const std::string& component, bool pressed) {
        buttons[user_path + component] = pressed;
    }

    void SetTrigger(const std::string& user_path, bool pressed) {
        SetButton(user_path, config.primary_activation_component, pressed);
    }

    AnchorHandle AddAnchorAt(XrVector3f position) {
        AnchorHandle handle = next_handle;
        EXPECT_EQ(controller->AddAnchor(xanchor::core::MakePose(position, XrQuaternionf{0.0f, 0.0f, 0.0f, 1.0f})),
                  XR_SUCCESS);
        return handle;
    }

    xanchor::core::ControllerConfig config;

    std::unique_ptr<testing::NiceMock<xanchor::test::MockAnchorSubsystem>> subsystem;
    std::unique_ptr<testing::NiceMock<xanchor::test::MockGestureInput>> input;
    std::unique_ptr<testing::NiceMock<xanchor::test::MockSceneHost>> scene;
    std::shared_ptr<testing::NiceMock<xanchor::test::MockAnchorStore>> store;
    std::unique_ptr<xanchor::core::AnchorInteractionController> controller;

    std::promise<std::shared_ptr<xanchor::core::IAnchorStore>> store_promise;
    xanchor::core::AnchorsChangedCallback anchors_changed;
    std::map<std::string, bool> buttons;
    std::map<std::string, XrVector3f> positions;
    std::vector<XrPosef> created_poses;
    std::vector<xanchor::core::AnchorError> errors;
    AnchorHandle next_handle = 100;
};
