#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "fusion/candidate_gatherer.hpp"
#include "fixtures/test_fixtures.hpp"
#include <thread>

using namespace clinscribe;
using namespace clinscribe::fusion;
using fixtures::MockTranscriptionProvider;
using fixtures::ScriptedProvider;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using ::testing::Invoke;
using ::testing::_;

namespace {

// Sleeps for a fixed time without looking at the cancellation token
class StubbornProvider : public TranscriptionProvider {
public:
    StubbornProvider(const std::string& name, std::chrono::milliseconds delay)
        : name_(name), delay_(delay) {}

    std::string getName() const override { return name_; }
    bool isDomainSpecialized() const override { return false; }

    TranscriptionCandidate transcribe(const AudioWindow&, const CancellationToken&) override {
        std::this_thread::sleep_for(delay_);
        return TranscriptionCandidate(name_, "late text", 0.9f);
    }

private:
    std::string name_;
    std::chrono::milliseconds delay_;
};

} // namespace

class CandidateGathererTest : public ::testing::Test {
protected:
    void SetUp() override {
        task_queue = std::make_shared<core::TaskQueue>();
        thread_pool = std::make_unique<core::ThreadPool>(4);
        thread_pool->start(task_queue);
    }

    void TearDown() override {
        thread_pool->stop();
    }

    CandidateGatherer makeGatherer(std::chrono::milliseconds timeout) {
        return CandidateGatherer(task_queue, timeout, handler);
    }

    // Raises the token after a delay from another thread
    std::thread cancelAfter(CancellationToken token, std::chrono::milliseconds delay) {
        return std::thread([token, delay]() mutable {
            std::this_thread::sleep_for(delay);
            token.cancel();
        });
    }

    std::shared_ptr<core::TaskQueue> task_queue;
    std::unique_ptr<core::ThreadPool> thread_pool;
    utils::ErrorHandler handler;
    AudioWindow window = fixtures::makeWindow("w1");
};

TEST_F(CandidateGathererTest, CollectsEveryProviderInSubmissionOrder) {
    auto slowFirst = std::make_shared<ScriptedProvider>("slow", "chest pain", 0.8f, false,
                                                        std::chrono::milliseconds(60));
    auto fastSecond = std::make_shared<ScriptedProvider>("fast", "chest pains", 0.6f);
    auto gatherer = makeGatherer(std::chrono::milliseconds(2000));

    GatherResult result = gatherer.gather({slowFirst, fastSecond}, window, CancellationToken(),
                                          CancellationPolicy::FUSE_COMPLETED);

    ASSERT_EQ(result.candidates.size(), 2u);
    EXPECT_EQ(result.candidates[0].provider_name, "slow");
    EXPECT_EQ(result.candidates[1].provider_name, "fast");
    ASSERT_EQ(result.reports.size(), 2u);
    EXPECT_EQ(result.countOutcome(ProviderOutcome::COMPLETED), 2u);
    EXPECT_FALSE(result.cancelled);
    EXPECT_FALSE(result.discarded);
    EXPECT_EQ(handler.getErrorCount(), 0u);
    EXPECT_EQ(slowFirst->callCount(), 1);
}

TEST_F(CandidateGathererTest, FillsProviderNameAndSpecialisation) {
    auto mock = std::make_shared<NiceMock<MockTranscriptionProvider>>();
    ON_CALL(*mock, getName()).WillByDefault(Return("cardio-asr"));
    ON_CALL(*mock, isDomainSpecialized()).WillByDefault(Return(true));
    EXPECT_CALL(*mock, transcribe(_, _))
        .WillOnce(Invoke([](const AudioWindow& w, const CancellationToken&) {
            TranscriptionCandidate candidate;
            candidate.text = "troponin pending";
            candidate.overall_confidence = 0.7f;
            candidate.segments.emplace_back("troponin pending", w.start_time, w.end_time, 0.7f);
            return candidate;
        }));
    auto gatherer = makeGatherer(std::chrono::milliseconds(2000));

    GatherResult result = gatherer.gather({mock}, window, CancellationToken(),
                                          CancellationPolicy::FUSE_COMPLETED);

    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.candidates[0].provider_name, "cardio-asr");
    EXPECT_TRUE(result.candidates[0].domain_specialized);
    EXPECT_DOUBLE_EQ(result.candidates[0].segments.at(0).end_time, window.end_time);
}

TEST_F(CandidateGathererTest, SlowProviderIsExcludedAndReported) {
    auto fast = std::make_shared<ScriptedProvider>("fast", "no fever", 0.8f);
    auto slow = std::make_shared<StubbornProvider>("slow", std::chrono::milliseconds(400));
    auto gatherer = makeGatherer(std::chrono::milliseconds(50));

    GatherResult result = gatherer.gather({slow, fast}, window, CancellationToken(),
                                          CancellationPolicy::FUSE_COMPLETED);

    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.candidates[0].provider_name, "fast");
    EXPECT_EQ(result.reports[0].outcome, ProviderOutcome::TIMED_OUT);
    EXPECT_EQ(result.reports[1].outcome, ProviderOutcome::COMPLETED);
    EXPECT_EQ(handler.getErrorCount(utils::ErrorCategory::PROVIDER), 1u);
    EXPECT_EQ(handler.getErrorCount(utils::ErrorSeverity::WARNING), 1u);
}

TEST_F(CandidateGathererTest, ThrowingProviderIsExcludedAndReported) {
    auto failing = std::make_shared<NiceMock<MockTranscriptionProvider>>();
    ON_CALL(*failing, getName()).WillByDefault(Return("flaky"));
    EXPECT_CALL(*failing, transcribe(_, _)).WillOnce(Throw(std::runtime_error("model not loaded")));
    auto healthy = std::make_shared<ScriptedProvider>("healthy", "denies chest pain", 0.9f);
    auto gatherer = makeGatherer(std::chrono::milliseconds(2000));

    GatherResult result = gatherer.gather({failing, healthy}, window, CancellationToken(),
                                          CancellationPolicy::FUSE_COMPLETED);

    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.reports[0].outcome, ProviderOutcome::FAILED);
    EXPECT_NE(result.reports[0].detail.find("model not loaded"), std::string::npos);
    EXPECT_EQ(handler.getErrorCount(utils::ErrorSeverity::ERROR), 1u);
}

TEST_F(CandidateGathererTest, AllProvidersFailing) {
    auto first = std::make_shared<ScriptedProvider>("a", "x", 0.5f, false, std::chrono::milliseconds(0), true);
    auto second = std::make_shared<StubbornProvider>("b", std::chrono::milliseconds(300));
    auto gatherer = makeGatherer(std::chrono::milliseconds(40));

    EXPECT_THROW(gatherer.gather({first, second}, window, CancellationToken(),
                                 CancellationPolicy::FUSE_COMPLETED),
                 utils::AllProvidersFailedException);
    EXPECT_EQ(handler.getErrorCount(utils::ErrorCategory::PROVIDER), 2u);
}

TEST_F(CandidateGathererTest, NoProvidersIsEmptyInput) {
    auto gatherer = makeGatherer(std::chrono::milliseconds(100));

    EXPECT_THROW(gatherer.gather({}, window, CancellationToken(), CancellationPolicy::FUSE_COMPLETED),
                 utils::EmptyInputException);
}

TEST_F(CandidateGathererTest, NullProviderRejected) {
    auto gatherer = makeGatherer(std::chrono::milliseconds(100));
    std::vector<TranscriptionProviderPtr> providers = {nullptr};

    EXPECT_THROW(gatherer.gather(providers, window, CancellationToken(), CancellationPolicy::FUSE_COMPLETED),
                 std::invalid_argument);
}

TEST_F(CandidateGathererTest, CancellationKeepsCompletedCandidates) {
    auto fast = std::make_shared<ScriptedProvider>("fast", "pain since yesterday", 0.8f);
    auto slow = std::make_shared<StubbornProvider>("slow", std::chrono::milliseconds(500));
    auto gatherer = makeGatherer(std::chrono::milliseconds(5000));
    CancellationToken token;

    std::thread canceller = cancelAfter(token, std::chrono::milliseconds(100));
    GatherResult result = gatherer.gather({fast, slow}, window, token, CancellationPolicy::FUSE_COMPLETED);
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.discarded);
    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.candidates[0].provider_name, "fast");
    EXPECT_EQ(result.reports[1].outcome, ProviderOutcome::CANCELLED);
    // Cancellation is not a provider failure
    EXPECT_EQ(handler.getErrorCount(), 0u);
}

TEST_F(CandidateGathererTest, CancellationCanDiscardWindow) {
    auto fast = std::make_shared<ScriptedProvider>("fast", "pain since yesterday", 0.8f);
    auto slow = std::make_shared<StubbornProvider>("slow", std::chrono::milliseconds(500));
    auto gatherer = makeGatherer(std::chrono::milliseconds(5000));
    CancellationToken token;

    std::thread canceller = cancelAfter(token, std::chrono::milliseconds(100));
    GatherResult result = gatherer.gather({fast, slow}, window, token, CancellationPolicy::DISCARD_WINDOW);
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.discarded);
    EXPECT_TRUE(result.candidates.empty());
    EXPECT_EQ(result.reports.size(), 2u);
}

TEST_F(CandidateGathererTest, CancelledWithNothingCompletedDoesNotThrow) {
    auto slow = std::make_shared<StubbornProvider>("slow", std::chrono::milliseconds(400));
    auto gatherer = makeGatherer(std::chrono::milliseconds(5000));
    CancellationToken token;

    std::thread canceller = cancelAfter(token, std::chrono::milliseconds(50));
    GatherResult result;
    EXPECT_NO_THROW(result = gatherer.gather({slow}, window, token, CancellationPolicy::FUSE_COMPLETED));
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.candidates.empty());
    EXPECT_EQ(result.countOutcome(ProviderOutcome::CANCELLED), 1u);
}

TEST_F(CandidateGathererTest, CooperativeProviderStopsOnCancel) {
    auto cooperative = std::make_shared<ScriptedProvider>("coop", "text", 0.5f, false,
                                                          std::chrono::milliseconds(5000));
    auto gatherer = makeGatherer(std::chrono::milliseconds(10000));
    CancellationToken token;

    auto started = std::chrono::steady_clock::now();
    std::thread canceller = cancelAfter(token, std::chrono::milliseconds(50));
    GatherResult result = gatherer.gather({cooperative}, window, token, CancellationPolicy::DISCARD_WINDOW);
    canceller.join();

    EXPECT_TRUE(result.discarded);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(4000));
}

TEST_F(CandidateGathererTest, TimedOutProviderReleasesItsWorker) {
    // Two workers: a timed-out provider that kept running would leave the
    // next window's fast provider stuck in the queue
    auto narrowQueue = std::make_shared<core::TaskQueue>();
    core::ThreadPool narrowPool(2);
    narrowPool.start(narrowQueue);
    CandidateGatherer gatherer(narrowQueue, std::chrono::milliseconds(50), handler);

    auto slow = std::make_shared<ScriptedProvider>("slow", "late text", 0.9f, false,
                                                   std::chrono::milliseconds(1000));
    auto fast = std::make_shared<ScriptedProvider>("fast", "no chest pain", 0.8f);
    CancellationToken capture;

    for (int i = 0; i < 3; ++i) {
        const std::string id = "w" + std::to_string(i);
        GatherResult result;
        ASSERT_NO_THROW(result = gatherer.gather({slow, fast}, fixtures::makeWindow(id), capture,
                                                 CancellationPolicy::FUSE_COMPLETED)) << id;

        ASSERT_EQ(result.candidates.size(), 1u) << id;
        EXPECT_EQ(result.candidates[0].provider_name, "fast") << id;
        EXPECT_EQ(result.reports[0].outcome, ProviderOutcome::TIMED_OUT) << id;
        EXPECT_FALSE(result.cancelled) << id;
    }
    narrowPool.stop();

    // The window token never leaks back into the caller's token
    EXPECT_FALSE(capture.isCancelled());
    EXPECT_EQ(slow->callCount(), 3);
    EXPECT_EQ(fast->callCount(), 3);
    EXPECT_EQ(handler.getErrorCount(utils::ErrorCategory::PROVIDER), 3u);
}

TEST_F(CandidateGathererTest, ChildTokenFollowsParent) {
    CancellationToken parent;
    CancellationToken first = parent.child();
    CancellationToken second = parent.child();

    first.cancel();
    EXPECT_TRUE(first.isCancelled());
    EXPECT_FALSE(second.isCancelled());
    EXPECT_FALSE(parent.isCancelled());

    parent.cancel();
    EXPECT_TRUE(second.isCancelled());
    EXPECT_TRUE(second.child().isCancelled());
}

TEST_F(CandidateGathererTest, OutcomeNames) {
    EXPECT_EQ(providerOutcomeToString(ProviderOutcome::COMPLETED), "completed");
    EXPECT_EQ(providerOutcomeToString(ProviderOutcome::TIMED_OUT), "timed_out");
    EXPECT_EQ(providerOutcomeToString(ProviderOutcome::CANCELLED), "cancelled");
}
