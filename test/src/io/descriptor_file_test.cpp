#include "io/descriptor_file.hpp"

#include <cstdio>

#include <boost/optional.hpp>
#include <gtest/gtest.h>

#include "io/host_stdio_file.hpp"
#include "testutil/io/pipe.hpp"
#include "testutil/outcome.hpp"

using wasmbridge::io::DescriptorFile;
using wasmbridge::io::FsError;
using wasmbridge::io::SeekWhence;
using wasmbridge::test::isOpenDescriptor;
using wasmbridge::test::Pipe;

class DescriptorFileTest : public ::testing::Test {
 public:
  void SetUp() override {
    ASSERT_TRUE(pipe.valid());
  }

  std::shared_ptr<DescriptorFile> bind(int fd) {
    auto file = DescriptorFile::create(io_context, fd);
    EXPECT_TRUE(file) << file.error().message();
    return file.value();
  }

  boost::asio::io_context io_context;
  Pipe pipe;
};

/**
 * @given an open host descriptor
 * @when it is bound and the binding is closed
 * @then the binding used a different descriptor and the original stays open
 */
TEST_F(DescriptorFileTest, DuplicateIsIndependent) {
  auto file = bind(pipe.writeFd());
  int duplicate = file->nativeHandle();
  EXPECT_NE(duplicate, pipe.writeFd());
  EXPECT_TRUE(isOpenDescriptor(duplicate));

  EXPECT_OUTCOME_TRUE_1(file->close());
  EXPECT_FALSE(file->isOpen());
  EXPECT_EQ(file->nativeHandle(), -1);
  EXPECT_TRUE(isOpenDescriptor(pipe.writeFd()));

  // a second close is a no-op
  EXPECT_OUTCOME_TRUE_1(file->close());
}

/**
 * @given a binding that is never closed explicitly
 * @when it is destroyed
 * @then its duplicate is released and the original stays open
 */
TEST_F(DescriptorFileTest, DestructorReleasesDuplicate) {
  int duplicate = -1;
  {
    auto file = bind(pipe.readFd());
    duplicate = file->nativeHandle();
  }
  EXPECT_FALSE(isOpenDescriptor(duplicate));
  EXPECT_TRUE(isOpenDescriptor(pipe.readFd()));
}

/**
 * @given a descriptor number that is not open
 * @when it is bound
 * @then duplication fails with the OS error EBADF
 */
TEST_F(DescriptorFileTest, InvalidDescriptor) {
  auto file = DescriptorFile::create(io_context, 1 << 20);
  ASSERT_FALSE(file);
  EXPECT_EQ(file.error(), std::error_code(EBADF, std::system_category()));
}

/**
 * @given a bound descriptor
 * @when metadata, unlink, resize and readiness are queried
 * @then the fixed unknown answers are given
 */
TEST_F(DescriptorFileTest, Metadata) {
  auto file = bind(pipe.writeFd());
  EXPECT_EQ(file->size(), 0);
  EXPECT_EQ(file->lastAccessed(), 0);
  EXPECT_EQ(file->lastModified(), 0);
  EXPECT_EQ(file->createdTime(), 0);
  EXPECT_OUTCOME_TRUE_1(file->unlink());
  EXPECT_OUTCOME_ERROR(file->setLength(10), FsError::PERMISSION_DENIED);
  EXPECT_OUTCOME_TRUE(read_ready, file->pollReadReady());
  EXPECT_EQ(read_ready, 1);
  EXPECT_OUTCOME_TRUE(write_ready, file->pollWriteReady());
  EXPECT_EQ(write_ready, 1);
}

/**
 * @given bindings for both ends of a pipe
 * @when bytes are written through one and read through the other
 * @then the bytes arrive and end of stream reads as 0
 */
TEST_F(DescriptorFileTest, ReadWrite) {
  auto writer = bind(pipe.writeFd());
  auto reader = bind(pipe.readFd());

  std::string message = "ping";
  EXPECT_OUTCOME_TRUE(
      written,
      writer->write(gsl::span<const uint8_t>(
          reinterpret_cast<const uint8_t *>(message.data()), message.size())));
  EXPECT_EQ(written, message.size());

  std::vector<uint8_t> buffer(16);
  EXPECT_OUTCOME_TRUE(read, reader->read(buffer));
  ASSERT_EQ(read, message.size());
  EXPECT_EQ(std::string(buffer.begin(), buffer.begin() + read), message);

  EXPECT_OUTCOME_TRUE_1(writer->close());
  pipe.closeWrite();
  EXPECT_OUTCOME_TRUE(eof, reader->read(buffer));
  EXPECT_EQ(eof, 0);
}

/**
 * @given a bound pipe and a bound regular file
 * @when seeking
 * @then the pipe reports INVALID_SEEK and the file reports positions
 */
TEST_F(DescriptorFileTest, Seek) {
  auto piped = bind(pipe.readFd());
  EXPECT_OUTCOME_ERROR(piped->seek(0, SeekWhence::CURRENT),
                       FsError::INVALID_SEEK);

  FILE *tmp = std::tmpfile();
  ASSERT_NE(tmp, nullptr);
  ASSERT_GE(std::fputs("0123456789", tmp), 0);
  std::fflush(tmp);

  auto file = bind(fileno(tmp));
  EXPECT_OUTCOME_TRUE(end, file->seek(0, SeekWhence::END));
  EXPECT_EQ(end, 10);
  EXPECT_OUTCOME_TRUE(start, file->seek(2, SeekWhence::SET));
  EXPECT_EQ(start, 2);
  EXPECT_OUTCOME_TRUE(next, file->seek(3, SeekWhence::CURRENT));
  EXPECT_EQ(next, 5);
  EXPECT_OUTCOME_TRUE_1(file->close());
  std::fclose(tmp);
}

/**
 * @given a bound pipe and a pending asynchronous write
 * @when the io_context runs until it is out of work
 * @then the handler ran with the byte count and the data reached the pipe
 */
TEST_F(DescriptorFileTest, AsyncWriteDrainedByContext) {
  auto writer = bind(pipe.writeFd());
  std::string message = "async";
  boost::optional<outcome::result<size_t>> completion;
  writer->asyncWrite(
      gsl::span<const uint8_t>(
          reinterpret_cast<const uint8_t *>(message.data()), message.size()),
      [&completion](outcome::result<size_t> res) { completion.emplace(res); });
  // releasing the last owner must not cancel the queued write
  writer.reset();

  io_context.run();

  ASSERT_TRUE(completion);
  ASSERT_TRUE(*completion);
  EXPECT_EQ(completion->value(), message.size());
  pipe.closeWrite();
  EXPECT_EQ(pipe.readAll(), message);
}

/**
 * @given the default stream of a host descriptor
 * @when it is closed
 * @then the host descriptor is left open
 */
TEST_F(DescriptorFileTest, HostStdioFileBorrowsDescriptor) {
  auto file = std::make_shared<wasmbridge::io::HostStdioFile>(io_context,
                                                              pipe.writeFd());
  EXPECT_OUTCOME_ERROR(file->setLength(1), FsError::PERMISSION_DENIED);
  EXPECT_OUTCOME_TRUE_1(file->unlink());
  EXPECT_OUTCOME_TRUE_1(file->close());
  EXPECT_TRUE(isOpenDescriptor(pipe.writeFd()));
}
