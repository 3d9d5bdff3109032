#include <gtest/gtest.h>
#include "TestHelper.hpp"
#include "core/Quiz.hpp"
#include <stdexcept>

using namespace fretboard;

class QuizTest : public ::testing::Test {
protected:
    QuizTest()
        : positions({Position{0, 0}, Position{1, 0}, Position{2, 3}})
    {}

    void tick_for(Quiz& quiz, double seconds) {
        const int ticks = static_cast<int>(seconds / 0.1 + 0.5);
        for (int i = 0; i < ticks; ++i) quiz.tick(0.1);
    }

    TrainerConfig config;
    test::RecordingTonePlayer player;
    test::ScriptedPositionSource positions;
};

TEST_F(QuizTest, FirstQuestionIsSilent) {
    Quiz quiz(config, player, positions);
    EXPECT_EQ(player.count(), 0u);
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Asking);
    EXPECT_EQ(quiz.position(), (Position{0, 0}));
    EXPECT_EQ(quiz.mode(), Quiz::Mode::Normal);
    EXPECT_FALSE(quiz.feedback().has_value());
    EXPECT_FALSE(quiz.revealed_pitch().has_value());
    EXPECT_FALSE(quiz.countdown_running());
}

TEST_F(QuizTest, CorrectGuessScoresAndAutoAdvances) {
    Quiz quiz(config, player, positions);

    EXPECT_TRUE(quiz.guess("E"));
    EXPECT_EQ(quiz.score(), (Quiz::Score{1, 1}));
    ASSERT_TRUE(quiz.feedback().has_value());
    EXPECT_TRUE(quiz.feedback()->correct);
    EXPECT_EQ(quiz.feedback()->message, "Correct!");
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Advancing);
    ASSERT_EQ(player.count(), 1u);
    EXPECT_DOUBLE_EQ(player.last(), 82.41);

    // The same question cannot score twice
    EXPECT_FALSE(quiz.guess("E"));
    EXPECT_EQ(quiz.score(), (Quiz::Score{1, 1}));

    tick_for(quiz, 1.1);
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Advancing);
    quiz.tick(0.1);
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Asking);
    EXPECT_EQ(quiz.position(), (Position{1, 0}));
    EXPECT_FALSE(quiz.feedback().has_value());
    // Later questions sound on arrival
    EXPECT_EQ(player.count(), 2u);
    EXPECT_DOUBLE_EQ(player.last(), 110.0);
}

TEST_F(QuizTest, IncorrectGuessRevealsAndWaitsForNext) {
    Quiz quiz(config, player, positions);

    EXPECT_TRUE(quiz.guess("F"));
    EXPECT_EQ(quiz.score(), (Quiz::Score{0, 1}));
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Answered);
    ASSERT_TRUE(quiz.feedback().has_value());
    EXPECT_FALSE(quiz.feedback()->correct);
    EXPECT_EQ(quiz.feedback()->message, "Incorrect. That was E");
    EXPECT_EQ(quiz.revealed_pitch(), PitchClass::E);
    EXPECT_EQ(player.count(), 1u);

    EXPECT_FALSE(quiz.guess("E"));
    EXPECT_EQ(quiz.score(), (Quiz::Score{0, 1}));

    // No auto-advance after a wrong answer
    tick_for(quiz, 3.0);
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Answered);

    EXPECT_TRUE(quiz.advance());
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Asking);
    EXPECT_EQ(quiz.position(), (Position{1, 0}));
    EXPECT_FALSE(quiz.feedback().has_value());
}

TEST_F(QuizTest, FeedbackUsesBothSpellingsForAccidentals) {
    test::ScriptedPositionSource sharp_source({Position{0, 6}});
    Quiz quiz(config, player, sharp_source);
    EXPECT_EQ(quiz.target_pitch(), PitchClass::ASharp);

    EXPECT_TRUE(quiz.guess("B"));
    EXPECT_EQ(quiz.feedback()->message, "Incorrect. That was A# / Bb");
}

TEST_F(QuizTest, FlatSpellingIsCorrect) {
    test::ScriptedPositionSource sharp_source({Position{0, 6}});
    Quiz quiz(config, player, sharp_source);
    EXPECT_TRUE(quiz.guess("Bb"));
    EXPECT_EQ(quiz.score(), (Quiz::Score{1, 1}));
}

TEST_F(QuizTest, UnknownNameIsRejectedWithoutScoring) {
    Quiz quiz(config, player, positions);
    EXPECT_FALSE(quiz.guess("X"));
    EXPECT_FALSE(quiz.guess(""));
    EXPECT_EQ(quiz.score(), (Quiz::Score{0, 0}));
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Asking);
    EXPECT_EQ(player.count(), 0u);
}

TEST_F(QuizTest, AdvanceOnlyFromAnswered) {
    Quiz quiz(config, player, positions);
    EXPECT_FALSE(quiz.advance());
    quiz.guess("E");
    EXPECT_FALSE(quiz.advance());
}

TEST_F(QuizTest, SweatCountdownTimesOut) {
    Quiz quiz(config, player, positions);
    quiz.set_sweat_mode(true);
    EXPECT_EQ(quiz.mode(), Quiz::Mode::Sweat);
    EXPECT_TRUE(quiz.countdown_running());
    EXPECT_DOUBLE_EQ(quiz.time_remaining(), 5.0);

    for (int i = 0; i < 49; ++i) quiz.tick(0.1);
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Asking);

    quiz.tick(0.1);
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Answered);
    EXPECT_EQ(quiz.score(), (Quiz::Score{0, 1}));
    EXPECT_EQ(quiz.feedback()->message, "Time's up! That was E");
    EXPECT_EQ(quiz.time_remaining(), 0.0);
    EXPECT_EQ(player.count(), 1u);

    // Expiry fires once
    tick_for(quiz, 2.0);
    EXPECT_EQ(quiz.score(), (Quiz::Score{0, 1}));

    EXPECT_TRUE(quiz.advance());
    EXPECT_TRUE(quiz.countdown_running());
    EXPECT_DOUBLE_EQ(quiz.time_remaining(), 5.0);
}

TEST_F(QuizTest, TimeoutOutsideSweatIsRejected) {
    Quiz quiz(config, player, positions);
    EXPECT_FALSE(quiz.timeout());
    tick_for(quiz, 10.0);
    EXPECT_EQ(quiz.score(), (Quiz::Score{0, 0}));
}

TEST_F(QuizTest, TimeoutRequiresAnExpiredCountdown) {
    Quiz quiz(config, player, positions);
    quiz.set_sweat_mode(true);
    tick_for(quiz, 1.0);

    EXPECT_FALSE(quiz.timeout());
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Asking);
    EXPECT_EQ(quiz.score(), (Quiz::Score{0, 0}));
    EXPECT_TRUE(quiz.countdown_running());
    EXPECT_NEAR(quiz.time_remaining(), 4.0, 1e-9);
    EXPECT_EQ(player.count(), 0u);
}

TEST_F(QuizTest, OversizedTickTimesOutOnce) {
    Quiz quiz(config, player, positions);
    quiz.set_sweat_mode(true);
    quiz.tick(1e14);
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Answered);
    EXPECT_EQ(quiz.score(), (Quiz::Score{0, 1}));
    EXPECT_EQ(quiz.time_remaining(), 0.0);
}

TEST_F(QuizTest, GuessStopsTheCountdown) {
    Quiz quiz(config, player, positions);
    quiz.set_sweat_mode(true);
    tick_for(quiz, 2.0);
    EXPECT_TRUE(quiz.guess("F"));
    EXPECT_FALSE(quiz.countdown_running());
    tick_for(quiz, 5.0);
    EXPECT_EQ(quiz.score(), (Quiz::Score{0, 1}));
}

TEST_F(QuizTest, SweatCorrectDelayIsShorter) {
    Quiz quiz(config, player, positions);
    quiz.set_sweat_mode(true);
    EXPECT_TRUE(quiz.guess("E"));
    tick_for(quiz, 0.7);
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Advancing);
    quiz.tick(0.1);
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Asking);
    EXPECT_TRUE(quiz.countdown_running());
    EXPECT_DOUBLE_EQ(quiz.time_remaining(), 5.0);
}

TEST_F(QuizTest, ResetFromAnyPhase) {
    Quiz quiz(config, player, positions);
    quiz.guess("F");
    ASSERT_EQ(quiz.phase(), Quiz::Phase::Answered);
    quiz.reset();
    EXPECT_EQ(quiz.score(), (Quiz::Score{0, 0}));
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Asking);
    EXPECT_FALSE(quiz.feedback().has_value());

    quiz.guess(pitch_name(quiz.target_pitch()));
    ASSERT_EQ(quiz.phase(), Quiz::Phase::Advancing);
    quiz.reset();
    EXPECT_EQ(quiz.score(), (Quiz::Score{0, 0}));
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Asking);

    quiz.reset();
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Asking);
}

TEST_F(QuizTest, StudyModeBypassesScoring) {
    Quiz quiz(config, player, positions);
    quiz.set_study_mode(true);
    EXPECT_EQ(quiz.mode(), Quiz::Mode::Study);

    EXPECT_FALSE(quiz.guess("E"));
    EXPECT_TRUE(quiz.play_position(Position{1, 12}));
    EXPECT_NEAR(player.last(), 220.0, 1e-9);
    EXPECT_EQ(quiz.score(), (Quiz::Score{0, 0}));
    EXPECT_THROW(quiz.play_position(Position{6, 0}), std::out_of_range);
    EXPECT_THROW(quiz.play_position(Position{0, 13}), std::out_of_range);
}

TEST_F(QuizTest, FreePlayRequiresStudyMode) {
    Quiz quiz(config, player, positions);
    EXPECT_FALSE(quiz.play_position(Position{1, 0}));
    EXPECT_EQ(player.count(), 0u);
}

TEST_F(QuizTest, ModesAreMutuallyExclusive) {
    Quiz quiz(config, player, positions);

    quiz.set_sweat_mode(true);
    EXPECT_TRUE(quiz.countdown_running());
    quiz.set_study_mode(true);
    EXPECT_EQ(quiz.mode(), Quiz::Mode::Study);
    EXPECT_FALSE(quiz.countdown_running());

    quiz.set_sweat_mode(true);
    EXPECT_EQ(quiz.mode(), Quiz::Mode::Sweat);
    EXPECT_TRUE(quiz.countdown_running());

    // Turning study off leaves sweat untouched
    quiz.set_study_mode(false);
    EXPECT_EQ(quiz.mode(), Quiz::Mode::Sweat);

    quiz.set_sweat_mode(false);
    EXPECT_EQ(quiz.mode(), Quiz::Mode::Normal);
    EXPECT_FALSE(quiz.countdown_running());

    quiz.toggle_study_mode();
    EXPECT_EQ(quiz.mode(), Quiz::Mode::Study);
    quiz.toggle_study_mode();
    EXPECT_EQ(quiz.mode(), Quiz::Mode::Normal);
    quiz.toggle_sweat_mode();
    EXPECT_EQ(quiz.mode(), Quiz::Mode::Sweat);
}

TEST_F(QuizTest, SweatToggleResetsBudget) {
    Quiz quiz(config, player, positions);
    quiz.set_sweat_mode(true);
    tick_for(quiz, 3.0);
    EXPECT_NEAR(quiz.time_remaining(), 2.0, 1e-9);
    quiz.set_sweat_mode(true);
    EXPECT_DOUBLE_EQ(quiz.time_remaining(), 5.0);
}

TEST_F(QuizTest, PlayCurrentRepeatsTarget) {
    Quiz quiz(config, player, positions);
    quiz.play_current();
    quiz.play_current();
    ASSERT_EQ(player.count(), 2u);
    EXPECT_DOUBLE_EQ(player.played[0], 82.41);
    EXPECT_EQ(quiz.score(), (Quiz::Score{0, 0}));
}

TEST_F(QuizTest, MelodyFreezesCountdown) {
    Quiz quiz(config, player, positions);
    quiz.set_sweat_mode(true);
    tick_for(quiz, 2.0);

    ASSERT_TRUE(quiz.play_melody());
    EXPECT_TRUE(quiz.melody_playing());
    EXPECT_FALSE(quiz.countdown_running());
    EXPECT_FALSE(quiz.play_melody());
    ASSERT_TRUE(quiz.now_sounding().has_value());

    int ticks = 0;
    while (quiz.melody_playing() && ticks < 100) {
        quiz.tick(0.1);
        ++ticks;
    }
    EXPECT_FALSE(quiz.melody_playing());
    EXPECT_FALSE(quiz.now_sounding().has_value());
    // Longer than the sweat budget, yet no timeout
    EXPECT_GT(ticks, 40);
    EXPECT_EQ(quiz.phase(), Quiz::Phase::Asking);
    EXPECT_EQ(quiz.score(), (Quiz::Score{0, 0}));
    EXPECT_EQ(player.count(), config.melody.size());

    EXPECT_TRUE(quiz.countdown_running());
    EXPECT_DOUBLE_EQ(quiz.time_remaining(), 5.0);
}

TEST_F(QuizTest, CancelMelody) {
    Quiz quiz(config, player, positions);
    ASSERT_TRUE(quiz.play_melody());
    quiz.tick(0.3);
    quiz.cancel_melody();
    tick_for(quiz, 1.0);
    EXPECT_FALSE(quiz.melody_playing());
    EXPECT_EQ(player.count(), 2u);
    EXPECT_TRUE(quiz.play_melody());
}

TEST(QuizScoreTest, AccuracyPercent) {
    EXPECT_EQ((Quiz::Score{0, 0}).accuracy_percent(), 0);
    EXPECT_EQ((Quiz::Score{2, 3}).accuracy_percent(), 67);
    EXPECT_EQ((Quiz::Score{1, 8}).accuracy_percent(), 13);
    EXPECT_EQ((Quiz::Score{5, 5}).accuracy_percent(), 100);
}
