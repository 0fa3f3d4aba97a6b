#include "pipetoml/util/file-descriptor.hh"
#include "pipetoml/util/signals.hh"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

namespace pipetoml {

class PipeTest : public ::testing::Test
{
protected:
    Descriptor readSide = -1, writeSide = -1;

    void SetUp() override
    {
        int fds[2];
        ASSERT_EQ(pipe(fds), 0);
        readSide = fds[0];
        writeSide = fds[1];
    }

    void closeWriteSide()
    {
        close(writeSide);
        writeSide = -1;
    }

    void TearDown() override
    {
        setInterrupted(false);
        close(readSide);
        if (writeSide != -1)
            close(writeSide);
    }
};

TEST_F(PipeTest, drainReadsUntilEndOfFile)
{
    writeFull(writeSide, "{\"a\": 1}\n");
    closeWriteSide();

    ASSERT_EQ(drainFD(readSide), "{\"a\": 1}\n");
}

TEST_F(PipeTest, drainEmptyInput)
{
    closeWriteSide();

    ASSERT_EQ(drainFD(readSide), "");
}

TEST_F(PipeTest, drainLargeInput)
{
    /* Must fit in the pipe buffer, since nothing reads concurrently. */
    std::string data(50000, 'x');
    writeFull(writeSide, data);
    closeWriteSide();

    ASSERT_EQ(drainFD(readSide), data);
}

TEST_F(PipeTest, drainStopsWhenInterrupted)
{
    writeFull(writeSide, "data");
    closeWriteSide();

    setInterrupted(true);
    ASSERT_THROW(drainFD(readSide), Interrupted);
}

TEST_F(PipeTest, writeToClosedDescriptorFails)
{
    closeWriteSide();

    ASSERT_THROW(writeFull(writeSide, "data"), SysError);
}

TEST_F(PipeTest, writeIgnoresInterruptWhenAsked)
{
    setInterrupted(true);
    ASSERT_THROW(writeFull(writeSide, "x"), Interrupted);
    ASSERT_NO_THROW(writeFull(writeSide, "x", false));
}

} // namespace pipetoml
