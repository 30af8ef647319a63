/**
 * @file transfer_engine_test.cpp
 * @brief TransferEngine tests over a local socketpair
 */

#include <gtest/gtest.h>
#include "wharf/Reactor.h"
#include "wharf/TransferEngine.h"

#include <chrono>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

using namespace Wharf;

class TransferEngineTest : public ::testing::Test {
protected:
    UniqueFd engineSide;
    UniqueFd peerSide;
    std::filesystem::path filePath;
    RateBudget::Clock::time_point t0 = RateBudget::Clock::now();

    void SetUp() override {
        int fds[2];
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        engineSide.reset(fds[0]);
        peerSide.reset(fds[1]);

        std::string err;
        ASSERT_TRUE(setNonBlocking(engineSide.get(), err)) << err;
        ASSERT_TRUE(setNonBlocking(peerSide.get(), err)) << err;

        filePath = std::filesystem::temp_directory_path() /
                   ("wharf_engine_test_" + std::to_string(::getpid()) + ".bin");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(filePath, ec);
    }

    static std::string pattern(size_t size) {
        std::string data(size, '\0');
        for (size_t i = 0; i < size; ++i) {
            data[i] = static_cast<char>('a' + (i % 26));
        }
        return data;
    }

    void writeFile(const std::string& content) {
        std::ofstream out(filePath, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    std::string readFile() {
        std::ifstream in(filePath, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    UniqueFd openFile(int flags) {
        return UniqueFd(::open(filePath.c_str(), flags | O_CLOEXEC, 0644));
    }

    void drainPeer(std::string& out) {
        char buffer[65536];
        for (;;) {
            const ssize_t n = ::recv(peerSide.get(), buffer, sizeof(buffer), MSG_DONTWAIT);
            if (n <= 0) {
                return;
            }
            out.append(buffer, static_cast<size_t>(n));
        }
    }

    // Step until the engine stops, draining the peer between steps.
    TransferStatus runDownload(TransferEngine& engine, std::string& received) {
        for (int i = 0; i < 100000; ++i) {
            const TransferStatus status = engine.step(t0);
            drainPeer(received);
            if (status == TransferStatus::COMPLETED || status == TransferStatus::FAILED ||
                status == TransferStatus::THROTTLED) {
                return status;
            }
        }
        return TransferStatus::CONTINUE;
    }
};

TEST_F(TransferEngineTest, DownloadSendsWholeFile) {
    const std::string content = pattern(3 * TRANSFER_CHUNK_SIZE + 123);
    writeFile(content);

    TransferJob job;
    job.direction = TransferDirection::DOWNLOAD;
    job.virtualPath = "/big.bin";
    TransferEngine engine(job, openFile(O_RDONLY), engineSide.get(), nullptr, nullptr);

    EXPECT_EQ(engine.interest(), IoEvent::WRITABLE);

    std::string received;
    ASSERT_EQ(runDownload(engine, received), TransferStatus::COMPLETED);
    EXPECT_EQ(received, content);
    EXPECT_EQ(engine.bytesTransferred(), content.size());
}

TEST_F(TransferEngineTest, DownloadStartsAtRestartOffset) {
    const std::string content = pattern(10000);
    writeFile(content);

    TransferJob job;
    job.direction = TransferDirection::DOWNLOAD;
    job.startOffset = 4000;
    TransferEngine engine(job, openFile(O_RDONLY), engineSide.get(), nullptr, nullptr);

    std::string received;
    ASSERT_EQ(runDownload(engine, received), TransferStatus::COMPLETED);
    EXPECT_EQ(received, content.substr(4000));
    EXPECT_EQ(engine.bytesTransferred(), 6000u);
}

TEST_F(TransferEngineTest, OffsetAtEndSendsNothing) {
    writeFile(pattern(100));

    TransferJob job;
    job.startOffset = 100;
    TransferEngine engine(job, openFile(O_RDONLY), engineSide.get(), nullptr, nullptr);

    EXPECT_EQ(engine.step(t0), TransferStatus::COMPLETED);
    EXPECT_EQ(engine.bytesTransferred(), 0u);
}

TEST_F(TransferEngineTest, ListingSendsPayload) {
    TransferJob job;
    job.direction = TransferDirection::LISTING;
    job.listing = "a.txt\r\nb.txt\r\n";
    TransferEngine engine(job, UniqueFd(), engineSide.get(), nullptr, nullptr);

    std::string received;
    ASSERT_EQ(runDownload(engine, received), TransferStatus::COMPLETED);
    EXPECT_EQ(received, job.listing);
}

TEST_F(TransferEngineTest, UploadWritesAtOffsetUntilPeerCloses) {
    writeFile("0123456789");
    const std::string payload = pattern(70000);

    TransferJob job;
    job.direction = TransferDirection::UPLOAD;
    job.startOffset = 4;
    TransferEngine engine(job, openFile(O_WRONLY), engineSide.get(), nullptr, nullptr);
    EXPECT_EQ(engine.interest(), IoEvent::READABLE);

    size_t sent = 0;
    TransferStatus status = TransferStatus::CONTINUE;
    for (int i = 0; i < 100000 && status == TransferStatus::CONTINUE; ++i) {
        if (sent < payload.size()) {
            const ssize_t n = ::send(peerSide.get(), payload.data() + sent,
                                     payload.size() - sent, MSG_DONTWAIT | MSG_NOSIGNAL);
            if (n > 0) {
                sent += static_cast<size_t>(n);
            }
            if (sent == payload.size()) {
                ::shutdown(peerSide.get(), SHUT_WR);
            }
        }
        status = engine.step(t0);
    }

    ASSERT_EQ(status, TransferStatus::COMPLETED);
    EXPECT_EQ(engine.bytesTransferred(), payload.size());
    EXPECT_EQ(engine.fileOffset(), 4 + payload.size());
    EXPECT_EQ(readFile(), "0123" + payload);
}

TEST_F(TransferEngineTest, EmptyBudgetThrottlesAndRefillResumes) {
    writeFile(pattern(5000));

    RateBudget budget(1000, 1000, t0);
    TransferJob job;
    TransferEngine engine(job, openFile(O_RDONLY), engineSide.get(), &budget, nullptr);

    EXPECT_EQ(engine.step(t0), TransferStatus::CONTINUE);
    EXPECT_EQ(engine.bytesTransferred(), 1000u);

    EXPECT_EQ(engine.step(t0), TransferStatus::THROTTLED);
    EXPECT_FALSE(engine.hasTokens(t0));

    const auto later = t0 + std::chrono::milliseconds(500);
    EXPECT_TRUE(engine.hasTokens(later));
    EXPECT_EQ(engine.step(later), TransferStatus::CONTINUE);
    EXPECT_EQ(engine.bytesTransferred(), 1500u);
}

TEST_F(TransferEngineTest, StricterGlobalBudgetWins) {
    writeFile(pattern(5000));

    RateBudget perConnection(100000, 100000, t0);
    RateBudget global(100, 300, t0);
    TransferJob job;
    TransferEngine engine(job, openFile(O_RDONLY), engineSide.get(), &perConnection, &global);

    EXPECT_EQ(engine.step(t0), TransferStatus::CONTINUE);
    EXPECT_EQ(engine.bytesTransferred(), 300u);
    EXPECT_EQ(engine.step(t0), TransferStatus::THROTTLED);
    EXPECT_EQ(perConnection.available(t0), 100000u - 300u);
}

TEST_F(TransferEngineTest, AbortFailsNextStep) {
    writeFile(pattern(5000));

    TransferJob job;
    TransferEngine engine(job, openFile(O_RDONLY), engineSide.get(), nullptr, nullptr);
    engine.abort();

    EXPECT_TRUE(engine.isAborted());
    EXPECT_EQ(engine.step(t0), TransferStatus::FAILED);
    EXPECT_EQ(engine.failureKind(), SessionError::TRANSFER_SOCKET);
    EXPECT_EQ(engine.bytesTransferred(), 0u);
}

TEST_F(TransferEngineTest, PeerResetFailsDownload) {
    writeFile(pattern(4 * TRANSFER_CHUNK_SIZE));
    peerSide.reset();

    TransferJob job;
    TransferEngine engine(job, openFile(O_RDONLY), engineSide.get(), nullptr, nullptr);

    TransferStatus status = TransferStatus::CONTINUE;
    for (int i = 0; i < 10 && status == TransferStatus::CONTINUE; ++i) {
        status = engine.step(t0);
    }
    EXPECT_EQ(status, TransferStatus::FAILED);
    EXPECT_EQ(engine.failureKind(), SessionError::TRANSFER_SOCKET);
}
