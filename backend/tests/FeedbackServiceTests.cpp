// Runs the shipped lexicons and config end to end
#include "TestHelpers.hpp"
#include "FeedbackService.hpp"
#include <stdexcept>

#ifndef FEEDBACK_DATA_DIR
#define FEEDBACK_DATA_DIR "data"
#endif
#ifndef FEEDBACK_CONFIG_DIR
#define FEEDBACK_CONFIG_DIR "config"
#endif

using json = nlohmann::json;

class FeedbackServiceTest : public ::testing::Test {
protected:
    static ClassifierConfig shipped_config() {
        ClassifierConfig config;
        config.stopwords_path = std::string(FEEDBACK_DATA_DIR) + "/lexicons/stopwords.txt";
        config.positive_path = std::string(FEEDBACK_DATA_DIR) + "/lexicons/positive.txt";
        config.negative_path = std::string(FEEDBACK_DATA_DIR) + "/lexicons/negative.txt";
        return config;
    }

    void SetUp() override {
        ASSERT_TRUE(service.initialize(shipped_config()));
    }

    json check(const std::string& text) {
        return json::parse(service.check_feedback(text));
    }

    FeedbackService service;
};

TEST_F(FeedbackServiceTest, EndToEndExamples) {
    EXPECT_EQ(check("Your product is amazing!!!"), (json{{"classification", "Clean"}, {"sentiment", "Positive"}}));
    EXPECT_EQ(check("this is goooood"), (json{{"classification", "Clean"}, {"sentiment", "Positive"}}));
    EXPECT_EQ(check("f*ck this"), (json{{"classification", "Abusive"}}));
    EXPECT_EQ(check("f@ck this"), (json{{"classification", "Abusive"}}));
    EXPECT_EQ(check("We love it"), (json{{"classification", "Clean"}, {"sentiment", "Positive"}}));
    EXPECT_EQ(check("Mr Smith was helpful")["classification"], "Clean");
    EXPECT_EQ(check("hi, great product")["classification"], "Clean");
    EXPECT_EQ(check("\xF0\x9F\x96\x95"), (json{{"classification", "Abusive"}}));
    EXPECT_EQ(check(""), (json{{"classification", "Please give meaningful feedback"}}));
    EXPECT_EQ(check("   "), (json{{"classification", "Please give meaningful feedback"}}));
}

TEST_F(FeedbackServiceTest, SentimentOnShippedLexicons) {
    EXPECT_EQ(check("the product was terrible and slow")["sentiment"], "Negative");
    EXPECT_EQ(check("good and bad")["sentiment"], "Neutral");
    EXPECT_EQ(check("excelent support, very helpfull")["sentiment"], "Positive");
}

TEST_F(FeedbackServiceTest, DebugOutput) {
    json report = json::parse(service.check_feedback("f@ck this", true));
    EXPECT_EQ(report["classification"], "Abusive");
    EXPECT_TRUE(report.contains("abuse"));
    EXPECT_TRUE(report.contains("tokens"));
}

TEST_F(FeedbackServiceTest, Status) {
    json status = json::parse(service.status());
    EXPECT_TRUE(status["ready"].get<bool>());
    EXPECT_GT(status["lexicons"]["positive"].get<int>(), 0);
    EXPECT_GT(status["abusive_prefixes"].get<int>(), 0);
    EXPECT_DOUBLE_EQ(status["similarity_threshold"].get<double>(), 0.8);
}

TEST_F(FeedbackServiceTest, InitializesOnlyOnce) {
    EXPECT_FALSE(service.initialize(shipped_config()));
    EXPECT_TRUE(service.is_ready());
}

TEST(FeedbackServiceStartupTest, MissingLexiconRefusesToServe) {
    ScratchDir dir;
    ClassifierConfig config;
    config.stopwords_path = dir.file("missing.txt");
    config.positive_path = dir.write("pos.txt", "good\n");
    config.negative_path = dir.write("neg.txt", "bad\n");

    FeedbackService service;
    EXPECT_FALSE(service.initialize(config));
    EXPECT_FALSE(service.is_ready());
    EXPECT_THROW(service.classifier(), std::logic_error);
    EXPECT_FALSE(json::parse(service.status())["ready"].get<bool>());
}

TEST(FeedbackServiceStartupTest, ShippedConfigFileResolvesDataPaths) {
    ClassifierConfig config;
    ASSERT_TRUE(config.load_from_file(std::string(FEEDBACK_CONFIG_DIR) + "/classifier.json"));

    FeedbackService service;
    ASSERT_TRUE(service.initialize(config));
    EXPECT_EQ(json::parse(service.check_feedback("Your product is amazing!!!"))["sentiment"], "Positive");
}
