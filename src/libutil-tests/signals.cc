#include "pipetoml/util/signals.hh"

#include <gtest/gtest.h>

#include <csignal>

namespace pipetoml {

class InterruptTest : public ::testing::Test
{
protected:
    void TearDown() override
    {
        setInterrupted(false);
        interruptCheck = nullptr;
    }
};

TEST_F(InterruptTest, checkInterruptIsQuietByDefault)
{
    ASSERT_NO_THROW(checkInterrupt());
}

TEST_F(InterruptTest, flagMakesCheckInterruptThrow)
{
    setInterrupted(true);
    ASSERT_THROW(checkInterrupt(), Interrupted);
}

TEST_F(InterruptTest, perThreadCheck)
{
    interruptCheck = []() { return true; };
    ASSERT_TRUE(isInterrupted());
    ASSERT_FALSE(_isInterrupted);
    ASSERT_THROW(checkInterrupt(), Interrupted);
}

TEST_F(InterruptTest, notThrownWhileUnwinding)
{
    setInterrupted(true);

    struct CheckOnDestruction
    {
        ~CheckOnDestruction()
        {
            checkInterrupt();
        }
    };

    try {
        CheckOnDestruction guard;
        throw Error("unwinding");
    } catch (Error & e) {
        ASSERT_EQ(e.message(), "unwinding");
    }
}

TEST_F(InterruptTest, sigintSetsTheFlag)
{
    installInterruptHandlers();
    ASSERT_EQ(raise(SIGINT), 0);
    ASSERT_TRUE(_isInterrupted);
}

TEST_F(InterruptTest, sigtermSetsTheFlag)
{
    installInterruptHandlers();
    ASSERT_EQ(raise(SIGTERM), 0);
    ASSERT_THROW(checkInterrupt(), Interrupted);
}

} // namespace pipetoml
