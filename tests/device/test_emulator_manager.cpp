#include "device/android/emulator_manager.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include "common/mock_tool_output.hpp"
#include "common/test_support.hpp"

namespace devpreview::test {

namespace fs = std::filesystem;
using device::DeviceState;
using device::android::AndroidTool;
using device::android::EmulatorManager;
using namespace std::chrono_literals;

namespace {

constexpr const char* kSdkManagerList = "/sdk/cmdline-tools/latest/bin/sdkmanager --list";
constexpr const char* kAvdManager = "/sdk/cmdline-tools/latest/bin/avdmanager";
constexpr const char* kListAvd = "/sdk/cmdline-tools/latest/bin/avdmanager list avd";
constexpr const char* kListProfiles =
    "/sdk/cmdline-tools/latest/bin/avdmanager list device -c";
constexpr const char* kListNames = "/sdk/emulator/emulator -list-avds";
constexpr const char* kAdb = "/sdk/platform-tools/adb";
constexpr const char* kAdbDevices = "/sdk/platform-tools/adb devices";

auto adbDevices(std::initializer_list<int> ports) -> process::ProcessResult {
    std::string out = "List of devices attached\n";
    for (int port : ports) {
        out += "emulator-" + std::to_string(port) + "\tdevice\n";
    }
    return ok(out);
}

auto avdName(int port) -> std::string {
    return std::string(kAdb) + " -s emulator-" + std::to_string(port) +
           " emu avd name";
}

auto catalog() -> parser::PackageCatalog {
    auto parsed = parser::parsePackageCatalog(kSdkManagerListing);
    return parsed ? *parsed : parser::PackageCatalog{};
}

}  // namespace

class EmulatorSelectionTest : public ::testing::Test {
protected:
    config::AndroidSettings settings_;
};

TEST_F(EmulatorSelectionTest, NewestPlatformApiPrefersCodename) {
    auto api = device::android::selectPlatformApi(catalog(), settings_);
    ASSERT_TRUE(api.has_value());
    EXPECT_EQ(*api, "Tiramisu");
}

TEST_F(EmulatorSelectionTest, NoPlatformAtMinimumApi) {
    settings_.minimumApiLevel = "32";
    parser::PackageCatalog numericOnly({
        {"platforms;android-30", "3", "Android SDK Platform 30", ""},
        {"platforms;android-31", "3", "Android SDK Platform 31", ""},
    });
    auto api = device::android::selectPlatformApi(numericOnly, settings_);
    ASSERT_FALSE(api.has_value());
    EXPECT_EQ(api.error().code, PreviewErrorCode::ToolchainMissing);
}

TEST_F(EmulatorSelectionTest, ImageFollowsApiThenTagThenAbi) {
    auto image = device::android::selectEmulatorImage(catalog(), settings_);
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->apiLevel, "Tiramisu");
    EXPECT_EQ(image->tag, "google_apis");
    EXPECT_EQ(image->abi, "x86_64");
    EXPECT_EQ(image->packagePath,
              "system-images;android-Tiramisu;google_apis;x86_64");
}

TEST_F(EmulatorSelectionTest, AbiPreferenceNarrowsChoice) {
    settings_.supportedAbis = {"arm64-v8a"};
    auto image = device::android::selectEmulatorImage(catalog(), settings_);
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->packagePath, "system-images;android-31;google_apis;arm64-v8a");
}

TEST_F(EmulatorSelectionTest, NoMatchingImage) {
    settings_.supportedImages = {"android-wear"};
    auto image = device::android::selectEmulatorImage(catalog(), settings_);
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().code, PreviewErrorCode::ToolchainMissing);
}

class EmulatorManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.sdkRoot = "/sdk";
        settings_.bootPoll = device::BootPollPolicy{5, 200ms};
    }

    auto makeManager() -> EmulatorManager {
        return EmulatorManager(runner_, clock_, makeNullLogger(), settings_);
    }

    std::shared_ptr<FakeProcessRunner> runner_ =
        std::make_shared<FakeProcessRunner>();
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    config::AndroidSettings settings_;
};

TEST_F(EmulatorManagerTest, ToolPathsUnderSdkRoot) {
    auto manager = makeManager();
    EXPECT_EQ(manager.toolPath(AndroidTool::SdkManager).string(),
              "/sdk/cmdline-tools/latest/bin/sdkmanager");
    EXPECT_EQ(manager.toolPath(AndroidTool::AvdManager).string(),
              "/sdk/cmdline-tools/latest/bin/avdmanager");
    EXPECT_EQ(manager.toolPath(AndroidTool::Adb).string(),
              "/sdk/platform-tools/adb");
    EXPECT_EQ(manager.toolPath(AndroidTool::Emulator).string(),
              "/sdk/emulator/emulator");
}

TEST_F(EmulatorManagerTest, ToolPathsWithoutSdkRootUseSearchPath) {
    ::unsetenv("ANDROID_HOME");
    ::unsetenv("ANDROID_SDK_ROOT");
    settings_.sdkRoot.clear();
    auto manager = makeManager();
    EXPECT_TRUE(manager.sdkRoot().empty());
    EXPECT_EQ(manager.toolPath(AndroidTool::Adb).string(), "adb");
    EXPECT_EQ(manager.toolPath(AndroidTool::SdkManager).string(), "sdkmanager");
}

TEST_F(EmulatorManagerTest, ListPackagesRequiresTable) {
    runner_->on(kSdkManagerList, ok("Loading local repository...\n"));
    auto manager = makeManager();
    auto packages = manager.listPackages();
    ASSERT_FALSE(packages.has_value());
    EXPECT_EQ(packages.error().code, PreviewErrorCode::FormatError);
}

TEST_F(EmulatorManagerTest, FindEmulatorImage) {
    runner_->on(kSdkManagerList, ok(std::string(kSdkManagerListing)));
    auto manager = makeManager();
    auto image = manager.findEmulatorImage();
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->packagePath,
              "system-images;android-Tiramisu;google_apis;x86_64");
}

TEST_F(EmulatorManagerTest, MissingSdkManagerIsToolchainMissing) {
    auto manager = makeManager();
    auto image = manager.findEmulatorImage();
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().code, PreviewErrorCode::ToolchainMissing);
}

TEST_F(EmulatorManagerTest, ListAvdsAndNames) {
    runner_->on(kListAvd, ok(std::string(kAvdListing)));
    runner_->on(kListNames, ok(std::string(kEmulatorNames)));
    auto manager = makeManager();

    auto avds = manager.listAvds();
    ASSERT_TRUE(avds.has_value());
    EXPECT_EQ(avds->size(), 8u);

    auto names = manager.listEmulatorNames();
    ASSERT_TRUE(names.has_value());
    EXPECT_EQ(names->size(), 8u);
}

TEST_F(EmulatorManagerTest, DeviceProfilePreference) {
    runner_->on(kListProfiles, ok(std::string(kDeviceProfiles)));
    auto manager = makeManager();
    auto profile = manager.supportedDeviceProfile();
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(*profile, "pixel_5");
}

TEST_F(EmulatorManagerTest, DeviceProfileFallsBackToFirst) {
    settings_.preferredDeviceProfiles = {"automotive"};
    runner_->on(kListProfiles, ok(std::string(kDeviceProfiles)));
    auto manager = makeManager();
    auto profile = manager.supportedDeviceProfile();
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(*profile, "tv_1080p");
}

TEST_F(EmulatorManagerTest, NoDeviceProfiles) {
    runner_->on(kListProfiles, ok("\n"));
    auto manager = makeManager();
    auto profile = manager.supportedDeviceProfile();
    ASSERT_FALSE(profile.has_value());
    EXPECT_EQ(profile.error().code, PreviewErrorCode::ToolchainMissing);
}

TEST_F(EmulatorManagerTest, FindReportsRunningState) {
    runner_->on(kListAvd, ok(std::string(kAvdListing)));
    runner_->on(kAdbDevices, adbDevices({5554}));
    runner_->on(avdName(5554), ok("Pixel_5_API_31\nOK\n"));
    auto manager = makeManager();

    auto running = manager.find("Pixel_5_API_31");
    ASSERT_TRUE(running.has_value());
    ASSERT_TRUE(running->has_value());
    EXPECT_EQ((*running)->state, DeviceState::Booted);
    EXPECT_EQ((*running)->runtimeLabel, "Android 12.0 (S)");

    auto stopped = manager.find("Pixel_XL_API_28");
    ASSERT_TRUE(stopped.has_value());
    ASSERT_TRUE(stopped->has_value());
    EXPECT_EQ((*stopped)->state, DeviceState::Shutdown);

    auto missing = manager.find("NoSuchDevice");
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(missing->has_value());
}

TEST_F(EmulatorManagerTest, FindOrCreateReusesExisting) {
    runner_->on(kListNames, ok(std::string(kEmulatorNames)));
    auto manager = makeManager();
    EXPECT_TRUE(manager.findOrCreate("Pixel_5_API_31").has_value());
    EXPECT_EQ(runner_->countCalls(std::string(kAvdManager) + " create"), 0u);
    EXPECT_EQ(runner_->countCalls(kSdkManagerList), 0u);
}

TEST_F(EmulatorManagerTest, FindOrCreateCreatesAndPatchesConfig) {
    auto avdDir = fs::temp_directory_path() / "devpreview_emulator_test" / "MyEmu.avd";
    fs::create_directories(avdDir);
    {
        std::ofstream out(avdDir / "config.ini");
        out << "hw.keyboard=no\nhw.ramSize=2048\n";
    }

    runner_->on(kListNames, ok(std::string(kEmulatorNames)));
    runner_->on(kSdkManagerList, ok(std::string(kSdkManagerListing)));
    runner_->on(kListProfiles, ok(std::string(kDeviceProfiles)));
    runner_->on(std::string(kAvdManager) + " create avd", ok());
    runner_->on(kListAvd, ok("Available Android Virtual Devices:\n"
                             "    Name: MyEmu\n"
                             "    Path: " + avdDir.string() + "\n"));
    auto manager = makeManager();

    auto created = manager.findOrCreate("MyEmu");
    ASSERT_TRUE(created.has_value()) << created.error().toString();
    EXPECT_EQ(runner_->countCalls(
                  std::string(kAvdManager) +
                  " create avd -n MyEmu --force -k "
                  "'system-images;android-Tiramisu;google_apis;x86_64' "
                  "--device pixel_5 --abi google_apis/x86_64"),
              1u);

    std::ifstream in(avdDir / "config.ini");
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(),
              "hw.keyboard=yes\nhw.ramSize=2048\nhw.gpu.enabled=yes\n"
              "hw.gpu.mode=auto\n");

    std::error_code ec;
    fs::remove_all(avdDir.parent_path(), ec);
}

TEST_F(EmulatorManagerTest, CreateFailure) {
    runner_->on(std::string(kAvdManager) + " create avd",
                fail(1, "", "Error: Package path is not valid."));
    auto manager = makeManager();
    device::android::EmulatorImage image{"30", "google_apis", "x86_64",
                                         "system-images;android-30;google_apis;x86_64"};
    auto created = manager.create("Broken", image, "pixel_5");
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, PreviewErrorCode::DeviceCreation);
    EXPECT_EQ(created.error().details, "Error: Package path is not valid.");
}

TEST_F(EmulatorManagerTest, CreatedAvdMustBeListed) {
    runner_->on(std::string(kAvdManager) + " create avd", ok());
    runner_->on(kListAvd, ok(std::string(kAvdListing)));
    auto manager = makeManager();
    device::android::EmulatorImage image{"30", "google_apis", "x86_64",
                                         "system-images;android-30;google_apis;x86_64"};
    auto created = manager.create("Ghost", image, "pixel_5");
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, PreviewErrorCode::DeviceCreation);
}

TEST_F(EmulatorManagerTest, RunningEmulatorsNameEachPort) {
    runner_->on(kAdbDevices, adbDevices({5554, 5556}));
    runner_->on(avdName(5554), ok("Pixel_5_API_31\nOK\n"));
    runner_->on(avdName(5556), fail(1, "error: device offline"));
    auto manager = makeManager();

    auto running = manager.runningEmulators();
    ASSERT_TRUE(running.has_value());
    ASSERT_EQ(running->size(), 2u);
    EXPECT_EQ((*running)[0].serial, "emulator-5554");
    EXPECT_EQ((*running)[0].avdName, "Pixel_5_API_31");
    EXPECT_EQ((*running)[1].port, 5556);
    EXPECT_TRUE((*running)[1].avdName.empty());
}

TEST_F(EmulatorManagerTest, StartReusesRunningEmulator) {
    runner_->on(kAdbDevices, adbDevices({5554}));
    runner_->on(avdName(5554), ok("Pixel_5_API_31\nOK\n"));
    auto manager = makeManager();

    auto port = manager.start("Pixel_5_API_31");
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 5554);
    EXPECT_TRUE(runner_->spawned().empty());
}

TEST_F(EmulatorManagerTest, StartTrustsReportedPort) {
    runner_->on(kAdbDevices, adbDevices({5554}));
    runner_->on(kAdbDevices, adbDevices({5554}));
    runner_->on(kAdbDevices, adbDevices({5554, 5558}));
    runner_->on(avdName(5554), ok("Pixel_5_API_31\nOK\n"));
    runner_->on(avdName(5558), ok("MyEmu\nOK\n"));
    auto manager = makeManager();

    auto port = manager.start("MyEmu");
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 5558);

    auto spawned = runner_->spawned();
    ASSERT_EQ(spawned.size(), 1u);
    EXPECT_EQ(spawned[0], "/sdk/emulator/emulator @MyEmu -port 5556");
    EXPECT_EQ(clock_->sleeps(), 1);
}

TEST_F(EmulatorManagerTest, StartFailsWhenSpawnFails) {
    runner_->on(kAdbDevices, adbDevices({}));
    runner_->onSpawn(std::unexpected(process::ProcessError::NotFound));
    auto manager = makeManager();

    auto port = manager.start("MyEmu");
    ASSERT_FALSE(port.has_value());
    EXPECT_EQ(port.error().code, PreviewErrorCode::Launch);
    EXPECT_EQ(port.error().details, "executable not found");
}

TEST_F(EmulatorManagerTest, StartFailsWhenPortsExhausted) {
    settings_.lastEmulatorPort = 5556;
    runner_->on(kAdbDevices, adbDevices({5554, 5556}));
    runner_->on(avdName(5554), ok("Pixel_5_API_31\n"));
    runner_->on(avdName(5556), ok("Pixel_XL_API_28\n"));
    auto manager = makeManager();

    auto port = manager.start("MyEmu");
    ASSERT_FALSE(port.has_value());
    EXPECT_EQ(port.error().code, PreviewErrorCode::ResourceExhausted);
    EXPECT_TRUE(runner_->spawned().empty());
}

TEST_F(EmulatorManagerTest, StartTimesOutWhenEmulatorNeverRegisters) {
    runner_->on(kAdbDevices, adbDevices({}));
    auto manager = makeManager();

    auto port = manager.start("MyEmu");
    ASSERT_FALSE(port.has_value());
    EXPECT_EQ(port.error().code, PreviewErrorCode::BootTimeout);
    EXPECT_EQ(clock_->sleeps(), 4);
}

TEST_F(EmulatorManagerTest, BootWaitsForBootCompleted) {
    runner_->on(kAdbDevices, adbDevices({5554}));
    runner_->on(avdName(5554), ok("MyEmu\nOK\n"));
    const auto getprop = std::string(kAdb) +
                         " -s emulator-5554 shell getprop sys.boot_completed";
    runner_->on(getprop, fail(1, "error: device offline"));
    runner_->on(getprop, ok("\n"));
    runner_->on(getprop, ok("1\n"));
    auto manager = makeManager();

    auto port = manager.boot("MyEmu", true);
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 5554);
    EXPECT_EQ(runner_->countCalls(getprop), 3u);
    EXPECT_EQ(clock_->sleeps(), 2);
}

TEST_F(EmulatorManagerTest, BootTimesOut) {
    runner_->on(kAdbDevices, adbDevices({5554}));
    runner_->on(avdName(5554), ok("MyEmu\nOK\n"));
    runner_->on(std::string(kAdb) + " -s emulator-5554 shell getprop", ok("0\n"));
    auto manager = makeManager();

    auto port = manager.boot("MyEmu", true);
    ASSERT_FALSE(port.has_value());
    EXPECT_EQ(port.error().code, PreviewErrorCode::BootTimeout);
    EXPECT_EQ(port.error().message, "Timed out waiting for emulator-5554");
}

TEST_F(EmulatorManagerTest, Stop) {
    runner_->on(std::string(kAdb) + " -s emulator-5554 emu kill", ok("OK: killing emulator\n"));
    auto manager = makeManager();
    EXPECT_TRUE(manager.stop(5554).has_value());
    EXPECT_FALSE(manager.stop(5556).has_value());
}

TEST_F(EmulatorManagerTest, OpenUrl) {
    runner_->on(std::string(kAdb) + " -s emulator-5554 shell am start", ok());
    auto manager = makeManager();
    ASSERT_TRUE(
        manager.openUrl(5554, "http://10.0.2.2:3333/lwc/preview/c/hello").has_value());
    EXPECT_EQ(runner_->countCalls(
                  std::string(kAdb) +
                  " -s emulator-5554 shell am start -a android.intent.action.VIEW "
                  "-d http://10.0.2.2:3333/lwc/preview/c/hello"),
              1u);
}

TEST_F(EmulatorManagerTest, LaunchAppInstallsAndPassesExtras) {
    runner_->on(std::string(kAdb) + " -s emulator-5554 install", ok("Success\n"));
    runner_->on(std::string(kAdb) + " -s emulator-5554 shell am start", ok());
    auto manager = makeManager();

    auto launched = manager.launchApp(
        5554, std::string("/tmp/app.apk"), "com.example.app", ".MainActivity",
        {{"ComponentName", "c/hello"}, {"ProjectDir", "/tmp/proj"}});
    ASSERT_TRUE(launched.has_value());

    auto calls = runner_->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], std::string(kAdb) + " -s emulator-5554 install -r -t /tmp/app.apk");
    EXPECT_EQ(calls[1],
              std::string(kAdb) +
                  " -s emulator-5554 shell am start -S -n "
                  "com.example.app/.MainActivity -a android.intent.action.MAIN "
                  "-c android.intent.category.LAUNCHER --es ComponentName c/hello "
                  "--es ProjectDir /tmp/proj");
}

TEST_F(EmulatorManagerTest, LaunchAppFailure) {
    runner_->on(std::string(kAdb) + " -s emulator-5554 shell am start",
                fail(1, "Error: Activity class does not exist."));
    auto manager = makeManager();
    auto launched =
        manager.launchApp(5554, std::nullopt, "com.example.app", ".Main", {});
    ASSERT_FALSE(launched.has_value());
    EXPECT_EQ(launched.error().code, PreviewErrorCode::Launch);
}

}  // namespace devpreview::test
