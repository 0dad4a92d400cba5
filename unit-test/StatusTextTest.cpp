#include <algorithm>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "scoring/status_text.hpp"
#include "test/log_capture.hpp"

using namespace std;
using namespace nlohmann;
using namespace scoring;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ReturnArg;

struct mock_translation : public translation {
    MOCK_METHOD(string, gettext, (const string &msgid), (const, override));
    MOCK_METHOD(string, identifier, (), (const, override));
};

static bool contains_log(const vector<string> &messages, const string &needle) {
    return any_of(messages.begin(), messages.end(), [&](const string &msg) {
        return msg.find(needle) != string::npos;
    });
}

TEST(StatusTextTest, SimpleStatusTextRewrite) {
    EXPECT_EQ(get_simple_status_text("Evaluation didn't produce file %s"),
              "Output file was not produced. Check you are creating the output file "
              "with name given in the problem statement. You may wish to use or consult the templates for this problem.");
    EXPECT_EQ(get_simple_status_text("Execution timed out (wall clock limit exceeded)"),
              "Time limit exceeded before your program finished. "
              "This may be due to an infinite loop/recursion, or your "
              "algorithm may be too slow for this subtask");
    EXPECT_EQ(get_simple_status_text("Execution killed by signal 11"),
              "Program crashed. Possibly due to accessing or requesting invalid memory "
              "(e.g. out-of-bounds array access)");
    EXPECT_EQ(get_simple_status_text("Execution failed because the return code was nonzero"),
              "Your program did not finish successfully "
              "(return code nonzero). Possibly due to an Exception or Error being thrown.");
    EXPECT_EQ(get_simple_status_text("Output is correct"), "Output is correct");
    EXPECT_EQ(get_simple_status_text(""), "");
}

TEST(StatusTextTest, FormatWithArguments) {
    EXPECT_EQ(format_status_text(json::array({"Output is partially correct (%s)", "3/5"})),
              "Output is partially correct (3/5)");
    EXPECT_EQ(format_status_text(json::array({"Memory used: %d KiB", 2048})), "Memory used: 2048 KiB");
    EXPECT_EQ(format_status_text(json::array({"Score %.3f", 1.5})), "Score 1.500");
    EXPECT_EQ(format_status_text(json::array({"Checked: %s", true})), "Checked: True");
    EXPECT_EQ(format_status_text(json::array({"Output is correct"})), "Output is correct");
}

TEST(StatusTextTest, NumericConversions) {
    EXPECT_EQ(format_status_text(json::array({"Time %.3f", 2})), "Time 2.000");
    EXPECT_EQ(format_status_text(json::array({"Got %d", 3.7})), "Got 3");
    EXPECT_EQ(format_status_text(json::array({"Got %i", -3.7})), "Got -3");
    EXPECT_EQ(format_status_text(json::array({"Flag %d", true})), "Flag 1");
    EXPECT_EQ(format_status_text(json::array({"%d%% of %s", 50, "tests"})), "50% of tests");
    EXPECT_EQ(format_status_text(json::array({"Ratio %.2f and %d", 1, 2.0})), "Ratio 1.00 and 2");
}

TEST(StatusTextTest, StringForNumericConversion) {
    for (auto &status : {json::array({"Time %d ms", "abc"}),
                         json::array({"Score %.3f", "1.5"}),
                         json::array({"%s then %x", "ok", "ff"})}) {
        log_capture capture;
        EXPECT_EQ(format_status_text(status), "N/A") << status.dump();
        EXPECT_TRUE(contains_log(capture.captured(), "requires a number")) << status.dump();
    }
}

TEST(StatusTextTest, MalformedStatusWithInvalidUtf8) {
    log_capture capture;
    json status = json::array({"%s %s", string("\xff\xfe")});
    EXPECT_NO_THROW(EXPECT_EQ(format_status_text(status), "N/A"));
    EXPECT_TRUE(contains_log(capture.captured(), "Unexpected error when formatting status text"));
}

TEST(StatusTextTest, RewrittenTemplateIgnoresArguments) {
    EXPECT_EQ(format_status_text(json::array({"Execution timed out (wall clock limit exceeded)"})),
              "Time limit exceeded before your program finished. "
              "This may be due to an infinite loop/recursion, or your "
              "algorithm may be too slow for this subtask");
}

TEST(StatusTextTest, EmptyTemplate) {
    NiceMock<mock_translation> t;
    EXPECT_CALL(t, gettext(_)).Times(0);
    EXPECT_EQ(format_status_text(json::array({""}), t), "");
}

TEST(StatusTextTest, MalformedStatusIsNotAvailable) {
    for (auto &status : {json("Output is correct"),
                         json::array(),
                         json::array({42}),
                         json::array({"Output is partially correct (%s)"}),
                         json::array({"Output is correct", "extra"}),
                         json::array({"Output is partially correct (%s)", json::array({3, 5})}),
                         json::object()}) {
        log_capture capture;
        EXPECT_EQ(format_status_text(status), "N/A") << status.dump();
        EXPECT_TRUE(contains_log(capture.captured(), "Unexpected error when formatting status text"))
            << status.dump();
    }
}

TEST(StatusTextTest, TranslatesTemplateBeforeFormatting) {
    NiceMock<mock_translation> t;
    ON_CALL(t, gettext(_)).WillByDefault(ReturnArg<0>());
    EXPECT_CALL(t, gettext("Output is partially correct (%s)"))
        .WillOnce(Return("Output parzialmente corretto (%s)"));

    EXPECT_EQ(format_status_text(json::array({"Output is partially correct (%s)", "3/5"}), t),
              "Output parzialmente corretto (3/5)");
}

TEST(StatusTextTest, TranslatesRewrittenTemplate) {
    NiceMock<mock_translation> t;
    EXPECT_CALL(t, gettext("Program crashed. Possibly due to accessing or requesting invalid memory "
                           "(e.g. out-of-bounds array access)"))
        .WillOnce(Return("Il programma è andato in crash"));

    EXPECT_EQ(format_status_text(json::array({"Execution killed with signal 9"}), t), "Il programma è andato in crash");
}

TEST(StatusTextTest, NotAvailableIsTranslated) {
    NiceMock<mock_translation> t;
    ON_CALL(t, gettext(_)).WillByDefault(ReturnArg<0>());
    EXPECT_CALL(t, gettext("N/A")).WillOnce(Return("N/D"));

    log_capture capture;
    EXPECT_EQ(format_status_text(json::array({"Output is partially correct (%s)"}), t), "N/D");
}

TEST(StatusTextTest, CatalogTranslation) {
    catalog_translation t("it", {{"Output is correct", "Output corretto"}, {"N/A", "N/D"}});
    EXPECT_EQ(format_status_text(json::array({"Output is correct"}), t), "Output corretto");
    EXPECT_EQ(format_status_text(json::array({"Output isn't correct"}), t), "Output isn't correct");

    log_capture capture;
    EXPECT_EQ(format_status_text(json(nullptr), t), "N/D");
}
