#include <gtest/gtest.h>

#include "common/mocks_test.hpp"
#include "docuchat_core/services/context_assembler.hpp"

namespace docuchat_core {

namespace MockUtilities = docuchat_tests::MockUtilities;

TEST(ContextAssemblerTest, FormatsBlocksInGivenOrder) {
  auto first = MockUtilities::make_result("a", 0, 0.2f, "alpha text");
  first.document.title = "Alpha";
  first.document.category = DocumentCategory::Politics;
  auto second = MockUtilities::make_result("b", 0, 0.9f, "beta text");
  second.document.title = "Beta";
  second.document.category = DocumentCategory::Manual;

  std::string context = ContextAssembler::build_context({first, second}, 10000);

  EXPECT_EQ(context,
            "Document: Alpha (politics)\nContent: alpha text\n\n---\n\n"
            "Document: Beta (manual)\nContent: beta text");
}

TEST(ContextAssemblerTest, TruncatesAtCodePointLimit) {
  auto result = MockUtilities::make_result("a", 0, 1.0f, "\xC3\xA9\xC3\xA9\xC3\xA9");
  result.document.title = "T";

  // "Document: T (manual)\nContent: " is 30 code points
  std::string context = ContextAssembler::build_context({result}, 32);

  EXPECT_EQ(context, "Document: T (manual)\nContent: \xC3\xA9\xC3\xA9");
}

TEST(ContextAssemblerTest, EmptyInputGivesEmptyContext) {
  EXPECT_EQ(ContextAssembler::build_context({}, 100), "");
  EXPECT_EQ(ContextAssembler::build_context({MockUtilities::make_result("a", 0, 1.0f)}, 0), "");
}

}  // namespace docuchat_core
