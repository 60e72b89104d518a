#include <gtest/gtest.h>

#include "vmsandbox/analyzers/content_classifier.hpp"

using namespace vmsandbox::analyzers;
using vmsandbox::core::GuestPath;

namespace {

struct ProfileParam {
  std::string extension;
  ContentCategory category;
  std::string tool;
};

std::string ParamName(const ::testing::TestParamInfo<ProfileParam>& info) {
  std::string name = info.param.extension.substr(1);
  return name.empty() ? "none" : name;
}

}  // namespace

class ClassifierTable : public testing::TestWithParam<ProfileParam> {};

TEST_P(ClassifierTable, MapsExtension) {
  auto& param = GetParam();
  auto profile = ContentClassifier::ClassifyExtension(param.extension);
  EXPECT_EQ(profile.extension, param.extension);
  EXPECT_EQ(profile.Category(), param.category);
  if (param.tool.empty()) {
    EXPECT_FALSE(profile.RuntimeCommand().has_value());
  } else {
    ASSERT_TRUE(profile.RuntimeCommand().has_value());
    EXPECT_EQ(*profile.RuntimeCommand(), param.tool);
  }
}

INSTANTIATE_TEST_SUITE_P(Table, ClassifierTable,
    testing::Values(
      ProfileParam{".py", ContentCategory::INTERPRETED, "python3"},
      ProfileParam{".js", ContentCategory::INTERPRETED, "node"},
      ProfileParam{".sh", ContentCategory::INTERPRETED, "bash"},
      ProfileParam{".rb", ContentCategory::INTERPRETED, "ruby"},
      ProfileParam{".pl", ContentCategory::INTERPRETED, "perl"},
      ProfileParam{".php", ContentCategory::INTERPRETED, "php"},
      ProfileParam{".c", ContentCategory::COMPILED, "gcc"},
      ProfileParam{".cpp", ContentCategory::COMPILED, "g++"},
      ProfileParam{".java", ContentCategory::COMPILED, "javac"},
      ProfileParam{".go", ContentCategory::COMPILED, "go"},
      ProfileParam{".pdf", ContentCategory::DOCUMENT, ""},
      ProfileParam{".doc", ContentCategory::DOCUMENT, ""},
      ProfileParam{".docx", ContentCategory::DOCUMENT, ""},
      ProfileParam{".txt", ContentCategory::DOCUMENT, ""},
      ProfileParam{".rtf", ContentCategory::DOCUMENT, ""},
      ProfileParam{".xyz", ContentCategory::UNSUPPORTED, ""},
      ProfileParam{".exe", ContentCategory::UNSUPPORTED, ""}),
    ParamName);

TEST(ContentClassifier, IgnoresCase) {
  auto upper = ContentClassifier::Classify(GuestPath("/home/kali/SandboxAnalysis/RUN.PY"));
  auto lower = ContentClassifier::Classify(GuestPath("/home/kali/SandboxAnalysis/run.py"));
  EXPECT_EQ(upper.extension, ".py");
  EXPECT_EQ(upper.Category(), lower.Category());
  EXPECT_EQ(upper.RuntimeCommand(), lower.RuntimeCommand());
}

TEST(ContentClassifier, DocumentsCarryKindTag) {
  auto profile = ContentClassifier::Classify(GuestPath("report.Pdf"));
  const auto* doc = std::get_if<Document>(&profile.toolchain);
  ASSERT_NE(doc, nullptr);
  EXPECT_EQ(doc->kind, DocumentKind::PDF);
  EXPECT_EQ(ContentClassifier::DocumentKindToString(doc->kind), "pdf");
}

TEST(ContentClassifier, NoExtensionIsUnsupported) {
  auto profile = ContentClassifier::Classify(GuestPath("/home/kali/Makefile"));
  EXPECT_EQ(profile.extension, "");
  EXPECT_FALSE(profile.IsSupported());
  EXPECT_TRUE(std::holds_alternative<Unsupported>(profile.toolchain));
}

TEST(ContentClassifier, HostPathsAndBareExtensions) {
  EXPECT_EQ(ContentClassifier::Classify(vmsandbox::core::HostPath("/tmp/x/Main.java")).Category(),
            ContentCategory::COMPILED);
  EXPECT_EQ(ContentClassifier::ClassifyExtension("GO").extension, ".go");
  EXPECT_EQ(ContentClassifier::ClassifyExtension("GO").Category(), ContentCategory::COMPILED);
}

TEST(ContentClassifier, CategoryNames) {
  EXPECT_EQ(ContentClassifier::CategoryToString(ContentCategory::INTERPRETED), "interpreted");
  EXPECT_EQ(ContentClassifier::CategoryToString(ContentCategory::UNSUPPORTED), "unsupported");
}
