#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace devicefarm::model {

enum class UploadType : std::uint8_t {
  kAndroidApp = 0,
  kIosApp,
  kExternalData,

  kInstrumentationTestPackage,
  kCalabashTestPackage,
  kUiAutomatorTestPackage,
  kUiAutomationTestPackage,
  kXcTestTestPackage,
  kXcTestUiTestPackage,
  kAppiumJavaTestNgTestPackage,
  kAppiumJavaJUnitTestPackage,
  kAppiumPythonTestPackage,
  kAppiumWebJavaTestNgTestPackage,
  kAppiumWebJavaJUnitTestPackage,
  kAppiumWebPythonTestPackage,
};

// Wire value of CreateUploadRequest.type.
constexpr std::string_view ToString(UploadType type) {
  switch (type) {
    case UploadType::kAndroidApp:
      return "ANDROID_APP";
    case UploadType::kIosApp:
      return "IOS_APP";
    case UploadType::kExternalData:
      return "EXTERNAL_DATA";
    case UploadType::kInstrumentationTestPackage:
      return "INSTRUMENTATION_TEST_PACKAGE";
    case UploadType::kCalabashTestPackage:
      return "CALABASH_TEST_PACKAGE";
    case UploadType::kUiAutomatorTestPackage:
      return "UIAUTOMATOR_TEST_PACKAGE";
    case UploadType::kUiAutomationTestPackage:
      return "UIAUTOMATION_TEST_PACKAGE";
    case UploadType::kXcTestTestPackage:
      return "XCTEST_TEST_PACKAGE";
    case UploadType::kXcTestUiTestPackage:
      return "XCTEST_UI_TEST_PACKAGE";
    case UploadType::kAppiumJavaTestNgTestPackage:
      return "APPIUM_JAVA_TESTNG_TEST_PACKAGE";
    case UploadType::kAppiumJavaJUnitTestPackage:
      return "APPIUM_JAVA_JUNIT_TEST_PACKAGE";
    case UploadType::kAppiumPythonTestPackage:
      return "APPIUM_PYTHON_TEST_PACKAGE";
    case UploadType::kAppiumWebJavaTestNgTestPackage:
      return "APPIUM_WEB_JAVA_TESTNG_TEST_PACKAGE";
    case UploadType::kAppiumWebJavaJUnitTestPackage:
      return "APPIUM_WEB_JAVA_JUNIT_TEST_PACKAGE";
    case UploadType::kAppiumWebPythonTestPackage:
      return "APPIUM_WEB_PYTHON_TEST_PACKAGE";
  }
  return "UNKNOWN";
}

// Case-insensitive suffix match; `extension` includes its dot (".apk").
bool HasExtension(std::string_view path, std::string_view extension);

/*
  Application classification by file extension:
    .apk        → ANDROID_APP
    .ipa / .zip → IOS_APP
  Anything else throws UnrecognizedArtifactType naming the file.
*/
UploadType ClassifyApp(const std::string& path);

// Only .zip is accepted as extra data.
UploadType ClassifyExtraData(const std::string& path);

// "Android" for .apk, "IOS" for .ipa. Throws UnrecognizedArtifactType otherwise.
std::string AppPlatformFor(const std::string& path);

} // namespace devicefarm::model
