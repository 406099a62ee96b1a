/**
 * @file transfer_engine_test.cpp
 * @brief TransferEngine tests over an in-process peer network
 *
 * Two TestPeers exchange real files through temp directories; the
 * FakeNetwork delivers every message on the receiver's inbox thread.
 */

#include "p2lan/ErrorCodes.h"
#include "p2lan/HashUtils.h"
#include "support/FakeNetwork.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace P2Lan;
using namespace P2Lan::Testing;

namespace fs = std::filesystem;

namespace {

std::string writeRandomFile(const fs::path& path, size_t size, unsigned seed) {
    std::mt19937 rng(seed);
    std::string content(size, '\0');
    for (auto& ch : content) {
        ch = static_cast<char>(rng() & 0xFF);
    }
    std::ofstream out(path, std::ios::binary);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return content;
}

std::string readAll(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

//=============================================================================
// Fixture
//=============================================================================

class TransferEngineTest : public ::testing::Test {
protected:
    FakeNetwork network;
    std::unique_ptr<TestPeer> alice;
    std::unique_ptr<TestPeer> bob;
    fs::path root;
    fs::path outbox;
    fs::path inbox;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::temp_directory_path() / (std::string("p2lan_transfer_") + info->name());
        std::error_code ec;
        fs::remove_all(root, ec);
        outbox = root / "outbox";
        inbox = root / "inbox";
        fs::create_directories(outbox);
        fs::create_directories(inbox);
    }

    void TearDown() override {
        alice.reset();
        bob.reset();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void createPeers(TestTimeouts bobTimeouts = TestTimeouts()) {
        alice = std::make_unique<TestPeer>(network, "alice", "Alice");
        bob = std::make_unique<TestPeer>(network, "bob", "Bob", bobTimeouts);

        TransferSettings sender;
        sender.maxChunkSizeKb = 1;
        alice->transfers.setSettings(sender);

        TransferSettings receiver;
        receiver.downloadPath = inbox.string();
        bob->transfers.setSettings(receiver);

        ASSERT_TRUE(alice->transfers.start());
        ASSERT_TRUE(bob->transfers.start());
    }

    std::vector<DataTransferTask> batchTasks(TestPeer& peer, const std::string& batchId) {
        std::vector<DataTransferTask> result;
        for (const auto& task : peer.transfers.transfers()) {
            if (task.batchId == batchId) {
                result.push_back(task);
            }
        }
        return result;
    }

    bool waitForStatus(TestPeer& peer, const std::string& taskId, TransferStatus status) {
        return waitUntil([&] {
            auto task = peer.transfers.transfer(taskId);
            return task && task->status == status;
        });
    }

    std::string onlyTaskOf(TestPeer& peer, const std::string& batchId) {
        auto tasks = batchTasks(peer, batchId);
        return tasks.size() == 1 ? tasks.front().id : std::string();
    }
};

//=============================================================================
// Preconditions
//=============================================================================

TEST_F(TransferEngineTest, SendRequiresKnownPairedUnblockedPeer) {
    createPeers();
    const auto file = outbox / "a.bin";
    writeRandomFile(file, 10, 1);

    auto unknown = alice->transfers.sendFiles({file.string()}, "bob");
    EXPECT_EQ(unknown.errorCode, ErrorCodes::PEER_UNKNOWN);

    introduce(*alice, *bob);
    auto unpaired = alice->transfers.sendFiles({file.string()}, "bob");
    EXPECT_EQ(unpaired.errorCode, ErrorCodes::PEER_NOT_PAIRED);

    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    std::string err;
    ASSERT_TRUE(alice->trust.setBlocked("bob", true, err)) << err;
    auto blocked = alice->transfers.sendFiles({file.string()}, "bob");
    EXPECT_EQ(blocked.errorCode, ErrorCodes::PEER_BLOCKED);

    EXPECT_TRUE(alice->transfers.transfers().empty());
    EXPECT_EQ(alice->messenger.sentCount(), 0u);
}

TEST_F(TransferEngineTest, SendChecksFilesAndOwnLimitsBeforeOffering) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));

    EXPECT_EQ(alice->transfers.sendFiles({}, "bob").errorCode, ErrorCodes::INVALID_ARGUMENT);

    std::vector<std::string> tooMany(MAX_FILES_PER_REQUEST + 1, (outbox / "x").string());
    EXPECT_EQ(alice->transfers.sendFiles(tooMany, "bob").errorCode, ErrorCodes::TRANSFER_TOO_MANY_FILES);

    EXPECT_EQ(alice->transfers.sendFiles({(outbox / "missing.bin").string()}, "bob").errorCode,
              ErrorCodes::TRANSFER_FILE_NOT_FOUND);

    const auto big = outbox / "big.bin";
    const auto small = outbox / "small.bin";
    writeRandomFile(big, 4096, 2);
    writeRandomFile(small, 3000, 3);

    TransferSettings limits = alice->transfers.settings();
    limits.maxReceiveFileSize = 4000;
    alice->transfers.setSettings(limits);
    EXPECT_EQ(alice->transfers.sendFiles({big.string()}, "bob").errorCode,
              ErrorCodes::TRANSFER_FILE_TOO_LARGE);

    limits.maxReceiveFileSize = -1;
    limits.maxTotalReceiveSize = 5000;
    alice->transfers.setSettings(limits);
    EXPECT_EQ(alice->transfers.sendFiles({big.string(), small.string()}, "bob").errorCode,
              ErrorCodes::TRANSFER_BATCH_TOO_LARGE);

    EXPECT_TRUE(alice->transfers.transfers().empty());
}

//=============================================================================
// Streaming
//=============================================================================

TEST_F(TransferEngineTest, TrustedPeerAutoAcceptsAndFileArrivesIntact) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));

    const auto file = outbox / "photo.jpg";
    const std::string content = writeRandomFile(file, 10 * 1024 + 123, 4);

    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result) << result.message;
    const std::string batchId = result.message;

    const std::string taskId = onlyTaskOf(*alice, batchId);
    ASSERT_FALSE(taskId.empty());
    ASSERT_TRUE(waitForStatus(*alice, taskId, TransferStatus::Completed));
    ASSERT_TRUE(waitForStatus(*bob, taskId, TransferStatus::Completed));

    auto received = bob->transfers.transfer(taskId);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->direction, TransferDirection::Receive);
    EXPECT_EQ(received->transferredBytes, static_cast<int64_t>(content.size()));
    EXPECT_EQ(fs::path(received->savePath), inbox / "photo.jpg");
    EXPECT_EQ(readAll(received->savePath), content);
    EXPECT_FALSE(fs::exists(inbox / "photo.jpg.part"));

    auto sent = alice->transfers.transfer(taskId);
    EXPECT_DOUBLE_EQ(sent->progress(), 1.0);
    EXPECT_EQ(bob->events.count<FileTransferRequestReceived>(), 0u);
}

TEST_F(TransferEngineTest, ExistingFileIsNotOverwritten) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));

    {
        std::ofstream existing(inbox / "notes.txt");
        existing << "keep me";
    }
    const auto file = outbox / "notes.txt";
    const std::string content = writeRandomFile(file, 2000, 5);

    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result) << result.message;
    const std::string taskId = onlyTaskOf(*alice, result.message);
    ASSERT_TRUE(waitForStatus(*bob, taskId, TransferStatus::Completed));

    EXPECT_EQ(readAll(inbox / "notes.txt"), "keep me");
    EXPECT_EQ(readAll(inbox / "notes (1).txt"), content);
}

TEST_F(TransferEngineTest, UntrustedPeerWaitsForManualAccept) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));

    const auto first = outbox / "one.bin";
    const auto second = outbox / "two.bin";
    const std::string c1 = writeRandomFile(first, 1500, 6);
    const std::string c2 = writeRandomFile(second, 2500, 7);

    auto result = alice->transfers.sendFiles({first.string(), second.string()}, "bob");
    ASSERT_TRUE(result) << result.message;
    const std::string batchId = result.message;

    auto request = bob->events.waitFor<FileTransferRequestReceived>();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->peerId, "alice");
    EXPECT_EQ(request->senderName, "Alice");
    EXPECT_EQ(request->fileCount, 2u);
    EXPECT_EQ(request->totalSize, 4000);
    EXPECT_EQ(request->batchId, batchId);

    for (const auto& task : batchTasks(*alice, batchId)) {
        EXPECT_EQ(task.status, TransferStatus::WaitingForApproval);
    }
    ASSERT_EQ(bob->transfers.pendingRequests().size(), 1u);

    ASSERT_TRUE(bob->transfers.respondToFileTransferRequest(request->requestId, true));
    EXPECT_TRUE(bob->transfers.pendingRequests().empty());

    // One-shot
    auto again = bob->transfers.respondToFileTransferRequest(request->requestId, true);
    EXPECT_EQ(again.errorCode, ErrorCodes::TRANSFER_NO_SUCH_REQUEST);

    for (const auto& task : batchTasks(*alice, batchId)) {
        ASSERT_TRUE(waitForStatus(*bob, task.id, TransferStatus::Completed)) << task.fileName;
        ASSERT_TRUE(waitForStatus(*alice, task.id, TransferStatus::Completed)) << task.fileName;
    }
    EXPECT_EQ(readAll(inbox / "one.bin"), c1);
    EXPECT_EQ(readAll(inbox / "two.bin"), c2);
}

//=============================================================================
// Rejection and expiry
//=============================================================================

TEST_F(TransferEngineTest, ManualRejectionRejectsEveryTask) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    const auto file = outbox / "doc.pdf";
    writeRandomFile(file, 100, 8);

    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result);
    const std::string taskId = onlyTaskOf(*alice, result.message);

    auto request = bob->events.waitFor<FileTransferRequestReceived>();
    ASSERT_TRUE(request.has_value());
    ASSERT_TRUE(bob->transfers.respondToFileTransferRequest(request->requestId, false));

    ASSERT_TRUE(waitForStatus(*alice, taskId, TransferStatus::Rejected));
    EXPECT_EQ(alice->transfers.transfer(taskId)->errorMessage, "Rejected by user");
    EXPECT_FALSE(bob->transfers.transfer(taskId).has_value());
}

TEST_F(TransferEngineTest, ReceiverEnforcesItsOwnSizeLimit) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));

    TransferSettings receiver = bob->transfers.settings();
    receiver.maxReceiveFileSize = 1000;
    bob->transfers.setSettings(receiver);

    const auto file = outbox / "video.mp4";
    writeRandomFile(file, 2000, 9);
    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result);
    const std::string taskId = onlyTaskOf(*alice, result.message);

    ASSERT_TRUE(waitForStatus(*alice, taskId, TransferStatus::Rejected));
    EXPECT_NE(alice->transfers.transfer(taskId)->errorMessage.find("exceeds limit"), std::string::npos);
    EXPECT_EQ(bob->events.count<FileTransferRequestReceived>(), 0u);
}

TEST_F(TransferEngineTest, ReceiverRejectsBlockedSender) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));
    std::string err;
    ASSERT_TRUE(bob->trust.setBlocked("alice", true, err)) << err;

    const auto file = outbox / "spam.bin";
    writeRandomFile(file, 10, 10);
    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result);
    const std::string taskId = onlyTaskOf(*alice, result.message);

    ASSERT_TRUE(waitForStatus(*alice, taskId, TransferStatus::Rejected));
    EXPECT_EQ(alice->transfers.transfer(taskId)->errorMessage, "User blocked");
}

TEST_F(TransferEngineTest, ReceiverRejectsSenderItDoesNotKnowAsPaired) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    std::string err;
    ASSERT_TRUE(bob->trust.unpair("alice", err)) << err;

    const auto file = outbox / "a.bin";
    writeRandomFile(file, 10, 11);
    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result);
    const std::string taskId = onlyTaskOf(*alice, result.message);

    ASSERT_TRUE(waitForStatus(*alice, taskId, TransferStatus::Rejected));
    EXPECT_EQ(alice->transfers.transfer(taskId)->errorMessage, "User not paired");
}

TEST_F(TransferEngineTest, UnansweredRequestExpiresOnBothSides) {
    TestTimeouts quick;
    quick.transfer.pendingExpiry = std::chrono::milliseconds(150);
    createPeers(quick);
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));

    const auto file = outbox / "late.bin";
    writeRandomFile(file, 10, 12);
    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result);
    const std::string taskId = onlyTaskOf(*alice, result.message);

    auto expired = bob->events.waitFor<FileTransferRequestExpired>();
    ASSERT_TRUE(expired.has_value());
    EXPECT_EQ(expired->peerId, "alice");
    EXPECT_TRUE(bob->transfers.pendingRequests().empty());

    ASSERT_TRUE(waitForStatus(*alice, taskId, TransferStatus::Rejected));
    EXPECT_EQ(alice->transfers.transfer(taskId)->errorMessage, "Request timed out (no response)");
}

//=============================================================================
// Cancel, pause, resume
//=============================================================================

TEST_F(TransferEngineTest, CancelIsOneShot) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    const auto file = outbox / "a.bin";
    writeRandomFile(file, 10, 13);

    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result);
    const std::string taskId = onlyTaskOf(*alice, result.message);
    ASSERT_TRUE(waitForStatus(*alice, taskId, TransferStatus::WaitingForApproval));

    ASSERT_TRUE(alice->transfers.cancelTransfer(taskId));
    auto task = alice->transfers.transfer(taskId);
    EXPECT_EQ(task->status, TransferStatus::Cancelled);
    EXPECT_EQ(task->errorMessage, "Cancelled by user");
    EXPECT_GT(task->finishedAtMs, 0);

    EXPECT_EQ(alice->transfers.cancelTransfer(taskId).errorCode, ErrorCodes::TRANSFER_NOT_CANCELLABLE);
    EXPECT_EQ(alice->transfers.cancelTransfer("task_missing").errorCode, ErrorCodes::TRANSFER_NOT_FOUND);
}

TEST_F(TransferEngineTest, CompletionAfterLocalCancelIsRefused) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));

    // Hold the sender's completion notice until the receiver has cancelled
    auto held = std::make_shared<std::optional<WireMessage>>();
    auto heldMutex = std::make_shared<std::mutex>();
    network.setDropFilter([held, heldMutex](const WireMessage& m) {
        if (m.type != MessageType::DataTransferComplete) {
            return false;
        }
        std::lock_guard<std::mutex> lock(*heldMutex);
        *held = m;
        return true;
    });

    const auto file = outbox / "late.bin";
    writeRandomFile(file, 3 * 1024, 51);
    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result);
    const std::string taskId = onlyTaskOf(*alice, result.message);

    ASSERT_TRUE(waitUntil([&] {
        std::lock_guard<std::mutex> lock(*heldMutex);
        return held->has_value();
    }));
    ASSERT_TRUE(bob->transfers.cancelTransfer(taskId));
    ASSERT_TRUE(waitForStatus(*alice, taskId, TransferStatus::Cancelled));

    WireMessage complete;
    {
        std::lock_guard<std::mutex> lock(*heldMutex);
        complete = held->value();
    }
    network.setDropFilter(nullptr);
    bob->dispatcher.dispatch(complete);

    auto received = bob->transfers.transfer(taskId);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->status, TransferStatus::Cancelled);
    EXPECT_FALSE(fs::exists(inbox / "late.bin"));
    EXPECT_TRUE(fs::exists(inbox / "late.bin.part"));
    for (const auto& change : bob->events.all<TransferStatusChanged>()) {
        EXPECT_NE(change.status, TransferStatus::Completed);
    }

    // The refusal does not turn the sender's cancel into a completion
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(alice->transfers.transfer(taskId)->status, TransferStatus::Cancelled);
}

TEST_F(TransferEngineTest, CompletedReceiveCannotBeCancelled) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));

    const auto file = outbox / "done.bin";
    const std::string content = writeRandomFile(file, 2 * 1024, 52);
    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result);
    const std::string taskId = onlyTaskOf(*alice, result.message);

    ASSERT_TRUE(waitForStatus(*bob, taskId, TransferStatus::Completed));
    EXPECT_EQ(bob->transfers.cancelTransfer(taskId).errorCode, ErrorCodes::TRANSFER_NOT_CANCELLABLE);
    ASSERT_TRUE(waitForStatus(*alice, taskId, TransferStatus::Completed));
    EXPECT_EQ(readAll(inbox / "done.bin"), content);
}

TEST_F(TransferEngineTest, ConcurrencyLimitQueuesExtraTasks) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));

    TransferSettings sender = alice->transfers.settings();
    sender.maxConcurrentTasks = 1;
    alice->transfers.setSettings(sender);

    // Without acknowledgements the first task stalls in progress
    network.setDropFilter([](const WireMessage& m) { return m.type == MessageType::DataChunkAck; });

    std::vector<std::string> paths;
    for (int i = 0; i < 3; ++i) {
        const auto file = outbox / ("f" + std::to_string(i) + ".bin");
        writeRandomFile(file, 20 * 1024, 20 + i);
        paths.push_back(file.string());
    }
    auto result = alice->transfers.sendFiles(paths, "bob");
    ASSERT_TRUE(result) << result.message;

    ASSERT_TRUE(waitUntil([&] {
        return alice->transfers.activeCount() == 1 && alice->transfers.queuedCount() == 2;
    }));

    size_t inProgress = 0;
    size_t pending = 0;
    for (const auto& task : batchTasks(*alice, result.message)) {
        if (task.status == TransferStatus::InProgress) ++inProgress;
        if (task.status == TransferStatus::Pending) ++pending;
    }
    EXPECT_EQ(inProgress, 1u);
    EXPECT_EQ(pending, 2u);
}

TEST_F(TransferEngineTest, OnlyOutgoingTransfersInProgressCanBePaused) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));
    network.setDropFilter([](const WireMessage& m) { return m.type == MessageType::DataChunkAck; });

    const auto file = outbox / "big.bin";
    writeRandomFile(file, 64 * 1024, 30);
    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result);
    const std::string taskId = onlyTaskOf(*alice, result.message);
    ASSERT_TRUE(waitForStatus(*alice, taskId, TransferStatus::InProgress));

    ASSERT_TRUE(alice->transfers.pauseTransfer(taskId));
    EXPECT_EQ(alice->transfers.transfer(taskId)->status, TransferStatus::Paused);
    EXPECT_EQ(alice->transfers.pauseTransfer(taskId).errorCode, ErrorCodes::TRANSFER_NOT_PAUSABLE);

    ASSERT_TRUE(waitUntil([&] { return bob->transfers.transfer(taskId).has_value(); }));
    EXPECT_EQ(bob->transfers.pauseTransfer(taskId).errorCode, ErrorCodes::TRANSFER_NOT_PAUSABLE);

    auto resumed = alice->transfers.resumeTransfer(taskId);
    ASSERT_TRUE(resumed) << resumed.message;
    EXPECT_EQ(resumed.message, taskId);
    EXPECT_EQ(alice->transfers.transfer(taskId)->status, TransferStatus::InProgress);
}

TEST_F(TransferEngineTest, ResumingCancelledSendContinuesThePartFile) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));

    // Stall after the first window of chunks
    network.setDropFilter([](const WireMessage& m) { return m.type == MessageType::DataChunkAck; });

    const auto file = outbox / "resume.bin";
    const std::string content = writeRandomFile(file, 16 * 1024, 40);
    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result);
    const std::string firstId = onlyTaskOf(*alice, result.message);

    ASSERT_TRUE(waitUntil([&] {
        auto task = bob->transfers.transfer(firstId);
        return task && task->transferredBytes == static_cast<int64_t>(CHUNK_WINDOW * 1024);
    }));
    ASSERT_TRUE(alice->transfers.cancelTransfer(firstId));
    ASSERT_TRUE(waitForStatus(*bob, firstId, TransferStatus::Cancelled));
    EXPECT_TRUE(fs::exists(inbox / "resume.bin.part"));

    network.setDropFilter(nullptr);
    auto resumed = alice->transfers.resumeTransfer(firstId);
    ASSERT_TRUE(resumed) << resumed.message;
    const std::string secondId = resumed.message;
    EXPECT_NE(secondId, firstId);
    EXPECT_EQ(alice->transfers.transfer(secondId)->resumedFromTaskId, firstId);

    ASSERT_TRUE(waitForStatus(*alice, secondId, TransferStatus::Completed));
    ASSERT_TRUE(waitForStatus(*bob, secondId, TransferStatus::Completed));
    EXPECT_EQ(readAll(inbox / "resume.bin"), content);
    EXPECT_FALSE(fs::exists(inbox / "resume.bin.part"));

    // A completed task is not resumable
    EXPECT_EQ(alice->transfers.resumeTransfer(secondId).errorCode, ErrorCodes::TRANSFER_NOT_RESUMABLE);
}

//=============================================================================
// Disconnect and cleanup
//=============================================================================

TEST_F(TransferEngineTest, PeerDisconnectFailsLiveTasks) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    const auto file = outbox / "a.bin";
    writeRandomFile(file, 10, 50);

    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result);
    const std::string taskId = onlyTaskOf(*alice, result.message);
    ASSERT_TRUE(bob->events.waitFor<FileTransferRequestReceived>().has_value());

    alice->transfers.onPeerDisconnected("bob");
    bob->transfers.onPeerDisconnected("alice");

    auto task = alice->transfers.transfer(taskId);
    EXPECT_EQ(task->status, TransferStatus::Failed);
    EXPECT_EQ(task->errorMessage, "Peer disconnected");
    EXPECT_TRUE(bob->transfers.pendingRequests().empty());
}

TEST_F(TransferEngineTest, CleanupPassRemovesOnlyEnabledTerminalTasks) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    const auto a = outbox / "a.bin";
    const auto b = outbox / "b.bin";
    writeRandomFile(a, 10, 60);
    writeRandomFile(b, 10, 61);

    auto first = alice->transfers.sendFiles({a.string()}, "bob");
    auto second = alice->transfers.sendFiles({b.string()}, "bob");
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    const std::string cancelled = onlyTaskOf(*alice, first.message);
    const std::string waiting = onlyTaskOf(*alice, second.message);
    ASSERT_TRUE(alice->transfers.cancelTransfer(cancelled));

    TransferSettings settings = alice->transfers.settings();
    settings.autoCleanupCancelled = true;
    settings.autoCleanupDelaySeconds = 0;
    alice->transfers.setSettings(settings);

    // The background pass may get there first
    EXPECT_LE(alice->transfers.runCleanupPass(), 1u);
    EXPECT_TRUE(waitUntil([&] { return !alice->transfers.transfer(cancelled).has_value(); }));
    EXPECT_EQ(alice->transfers.runCleanupPass(), 0u);
    EXPECT_TRUE(alice->transfers.transfer(waiting).has_value());
    EXPECT_GE(alice->events.count<TransferRemoved>(), 1u);
}

TEST_F(TransferEngineTest, ClearBatchRemovesEveryTask) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    const auto a = outbox / "a.bin";
    const auto b = outbox / "b.bin";
    writeRandomFile(a, 10, 70);
    writeRandomFile(b, 10, 71);

    auto result = alice->transfers.sendFiles({a.string(), b.string()}, "bob");
    ASSERT_TRUE(result);

    ASSERT_TRUE(alice->transfers.clearBatch(result.message, false));
    EXPECT_TRUE(batchTasks(*alice, result.message).empty());
    EXPECT_EQ(alice->transfers.clearBatch(result.message, false).errorCode, ErrorCodes::TRANSFER_NOT_FOUND);
}

TEST_F(TransferEngineTest, ClearingLiveReceiveCancelsAndDeletesPartFile) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));
    network.setDropFilter([](const WireMessage& m) { return m.type == MessageType::DataChunkAck; });

    const auto file = outbox / "c.bin";
    writeRandomFile(file, 16 * 1024, 80);
    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result);
    const std::string taskId = onlyTaskOf(*alice, result.message);

    ASSERT_TRUE(waitUntil([&] {
        auto task = bob->transfers.transfer(taskId);
        return task && task->transferredBytes > 0;
    }));
    ASSERT_TRUE(fs::exists(inbox / "c.bin.part"));

    ASSERT_TRUE(bob->transfers.clearTransfer(taskId, true));
    EXPECT_FALSE(bob->transfers.transfer(taskId).has_value());
    EXPECT_FALSE(fs::exists(inbox / "c.bin.part"));

    // The sender learns about it through the cancel message
    ASSERT_TRUE(waitForStatus(*alice, taskId, TransferStatus::Cancelled));
    EXPECT_EQ(bob->transfers.clearTransfer(taskId, true).errorCode, ErrorCodes::TRANSFER_NOT_FOUND);
}

TEST_F(TransferEngineTest, ClearAllRemovesFinishedAndLiveTasks) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    const auto a = outbox / "a.bin";
    const auto b = outbox / "b.bin";
    writeRandomFile(a, 10, 90);
    writeRandomFile(b, 10, 91);

    auto first = alice->transfers.sendFiles({a.string()}, "bob");
    auto second = alice->transfers.sendFiles({b.string()}, "bob");
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    ASSERT_TRUE(alice->transfers.cancelTransfer(onlyTaskOf(*alice, first.message)));

    auto cleared = alice->transfers.clearAllTransfers(false);
    ASSERT_TRUE(cleared);
    EXPECT_EQ(cleared.message, "2 transfers cleared");
    EXPECT_TRUE(alice->transfers.transfers().empty());
}

//=============================================================================
// Encryption and compression
//=============================================================================

class EncryptedTransferTest : public TransferEngineTest {
protected:
    void encryptSends(bool compress) {
        TransferSettings sender;
        sender.maxChunkSizeKb = 1;
        sender.encryptTransfers = true;
        sender.compressChunks = compress;
        alice->transfers.setSettings(sender);
    }

    /// Hold back every encrypted chunk, keeping the first one
    std::shared_ptr<std::optional<WireMessage>> holdEncryptedChunks() {
        auto held = std::make_shared<std::optional<WireMessage>>();
        auto heldMutex = m_heldMutex;
        network.setDropFilter([held, heldMutex](const WireMessage& m) {
            if (m.type != MessageType::EncryptedDataChunk) {
                return false;
            }
            std::lock_guard<std::mutex> lock(*heldMutex);
            if (!held->has_value()) {
                *held = m;
            }
            return true;
        });
        return held;
    }

    WireMessage firstHeld(const std::shared_ptr<std::optional<WireMessage>>& held) {
        std::lock_guard<std::mutex> lock(*m_heldMutex);
        return held->value();
    }

    bool hasHeld(const std::shared_ptr<std::optional<WireMessage>>& held) {
        std::lock_guard<std::mutex> lock(*m_heldMutex);
        return held->has_value();
    }

private:
    std::shared_ptr<std::mutex> m_heldMutex = std::make_shared<std::mutex>();
};

TEST_F(EncryptedTransferTest, EncryptedCompressedFileArrivesIntact) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));
    encryptSends(true);

    auto plainChunks = std::make_shared<std::atomic<int>>(0);
    auto sealedChunks = std::make_shared<std::atomic<int>>(0);
    network.setDropFilter([plainChunks, sealedChunks](const WireMessage& m) {
        if (m.type == MessageType::DataChunk) {
            ++*plainChunks;
        } else if (m.type == MessageType::EncryptedDataChunk) {
            ++*sealedChunks;
        }
        return false;
    });

    // Text compresses, the random tail does not
    const auto file = outbox / "report.txt";
    std::string content;
    while (content.size() < 6 * 1024) {
        content += "quarterly numbers, row " + std::to_string(content.size()) + "\n";
    }
    const auto noise = outbox / "noise.bin";
    content += writeRandomFile(noise, 3 * 1024 + 17, 77);
    {
        std::ofstream out(file, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result) << result.message;
    const std::string taskId = onlyTaskOf(*alice, result.message);
    ASSERT_TRUE(waitForStatus(*alice, taskId, TransferStatus::Completed));
    ASSERT_TRUE(waitForStatus(*bob, taskId, TransferStatus::Completed));

    EXPECT_EQ(readAll(inbox / "report.txt"), content);
    EXPECT_EQ(plainChunks->load(), 0);
    EXPECT_GT(sealedChunks->load(), 0);

    // The session key is reused by the next transfer
    const auto second = outbox / "second.bin";
    const std::string secondContent = writeRandomFile(second, 1500, 78);
    auto again = alice->transfers.sendFiles({second.string()}, "bob");
    ASSERT_TRUE(again) << again.message;
    ASSERT_TRUE(waitForStatus(*bob, onlyTaskOf(*alice, again.message), TransferStatus::Completed));
    EXPECT_EQ(readAll(inbox / "second.bin"), secondContent);
}

TEST_F(EncryptedTransferTest, TamperedChunkFailsTheReceive) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));
    encryptSends(false);
    auto held = holdEncryptedChunks();

    const auto file = outbox / "secret.bin";
    writeRandomFile(file, 4 * 1024, 81);
    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result) << result.message;
    const std::string taskId = onlyTaskOf(*alice, result.message);
    ASSERT_TRUE(waitUntil([&] { return hasHeld(held); }));

    WireMessage chunk = firstHeld(held);
    std::vector<uint8_t> ciphertext;
    ASSERT_TRUE(HashUtils::base64Decode(chunk.data["data"].get<std::string>(), ciphertext));
    ASSERT_FALSE(ciphertext.empty());
    ciphertext[ciphertext.size() / 2] ^= 0x01;
    chunk.data["data"] = HashUtils::base64Encode(ciphertext.data(), ciphertext.size());
    bob->dispatcher.dispatch(chunk);

    ASSERT_TRUE(waitForStatus(*bob, taskId, TransferStatus::Failed));
    auto received = bob->transfers.transfer(taskId);
    EXPECT_NE(received->errorMessage.find("Chunk authentication failed"), std::string::npos);
    EXPECT_EQ(received->transferredBytes, 0);
    EXPECT_FALSE(fs::exists(inbox / "secret.bin"));
}

TEST_F(EncryptedTransferTest, PlainChunkForEncryptedTransferIsRefused) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));
    encryptSends(false);
    auto held = holdEncryptedChunks();

    const auto file = outbox / "secret.bin";
    const std::string content = writeRandomFile(file, 2 * 1024, 82);
    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result) << result.message;
    const std::string taskId = onlyTaskOf(*alice, result.message);
    ASSERT_TRUE(waitUntil([&] { return hasHeld(held); }));

    // A downgraded copy of the first chunk carrying the cleartext
    const WireMessage sealed = firstHeld(held);
    nlohmann::json data = {
        {"taskId", taskId},
        {"offset", 0},
        {"isLast", false},
        {"data", HashUtils::base64Encode(reinterpret_cast<const uint8_t*>(content.data()), 1024)}
    };
    bob->dispatcher.dispatch(WireMessage::make(MessageType::DataChunk, sealed.fromUserId, sealed.toUserId, data));

    ASSERT_TRUE(waitForStatus(*bob, taskId, TransferStatus::Failed));
    EXPECT_NE(bob->transfers.transfer(taskId)->errorMessage.find("Unencrypted chunk"), std::string::npos);
    EXPECT_FALSE(fs::exists(inbox / "secret.bin"));
}

TEST_F(EncryptedTransferTest, ReceiverWithoutPinnedKeyRefusesKeyExchange) {
    createPeers();
    // Bob never saw a verified key for alice
    alice->identity.identityKey.clear();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));
    encryptSends(false);

    const auto file = outbox / "secret.bin";
    writeRandomFile(file, 2 * 1024, 83);
    auto result = alice->transfers.sendFiles({file.string()}, "bob");
    ASSERT_TRUE(result) << result.message;
    const std::string taskId = onlyTaskOf(*alice, result.message);

    ASSERT_TRUE(waitForStatus(*alice, taskId, TransferStatus::Failed));
    const std::string error = alice->transfers.transfer(taskId)->errorMessage;
    EXPECT_NE(error.find("Key exchange failed"), std::string::npos) << error;
    EXPECT_NE(error.find("No verified identity key"), std::string::npos) << error;
    EXPECT_FALSE(fs::exists(inbox / "secret.bin"));
}
