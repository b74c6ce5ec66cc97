#include "dxfer/session/orchestrator.hpp"
#include "dxfer/events/components.hpp"
#include "dxfer/events/event_bus.hpp"
#include "dxfer/events/events.hpp"
#include "dxfer/transport/loopback.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <array>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace asio = boost::asio;
namespace fs = std::filesystem;
using dxfer::Context;
using dxfer::ErrorKind;
using dxfer::Result;
using dxfer::events::Direction;
using dxfer::events::EventBus;
using dxfer::protocol::Bytes;
using dxfer::session::ReceivingSession;
using dxfer::session::SendingSession;
using dxfer::session::SessionReport;
using dxfer::transfer::DownloadDirectory;
using dxfer::transport::LoopbackEndpoints;
using dxfer::transport::StreamPtr;

namespace {

constexpr const char* kDigest010203 = "039058c6f2c0cb492c533b0a4d14ef77cc0f78abccced5287d84a1a2011cfb81";

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("dxfer_session_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary);
    out << contents;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

// Refuses one file name; everything else goes to the wrapped directory
class RefusingSinks : public dxfer::transfer::SinkProvider {
public:
    RefusingSinks(DownloadDirectory& inner, std::string refused)
        : inner_(inner), refused_(std::move(refused)) {}

    Result<std::unique_ptr<dxfer::transfer::ByteSink>> open_sink(const std::string& name,
                                                                 std::uint64_t size) override {
        if (name == refused_) {
            return dxfer::Err<std::unique_ptr<dxfer::transfer::ByteSink>>(ErrorKind::Io, "disk full");
        }
        return inner_.open_sink(name, size);
    }

private:
    DownloadDirectory& inner_;
    std::string refused_;
};

// Reads a stream to the end, calling on_bytes after every read
struct RawReader : std::enable_shared_from_this<RawReader> {
    StreamPtr stream;
    std::array<std::uint8_t, 7> buffer{};
    Bytes received;
    std::function<void(RawReader&)> on_bytes;

    explicit RawReader(StreamPtr s) : stream(std::move(s)) {}

    void start() {
        auto self = shared_from_this();
        stream->async_read_some(asio::buffer(buffer),
            [self](const boost::system::error_code& ec, std::size_t n) {
                if (ec) {
                    return;
                }
                self->received.insert(self->received.end(), self->buffer.begin(),
                                      self->buffer.begin() + static_cast<std::ptrdiff_t>(n));
                if (self->on_bytes) {
                    self->on_bytes(*self);
                }
                self->start();
            });
    }
};

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_dir_ = create_temp_dir();
        download_dir_ = create_temp_dir();
        endpoints_ = LoopbackEndpoints::make_pair(io_);

        bus_.subscribe<dxfer::events::TransferStartedEvent>([this](const dxfer::events::TransferStartedEvent& e) {
            if (e.direction == Direction::Send) {
                send_log_.push_back("start:" + e.name);
            }
        });
        bus_.subscribe<dxfer::events::TransferCompletedEvent>([this](const dxfer::events::TransferCompletedEvent& e) {
            if (e.direction == Direction::Send) {
                send_log_.push_back("done:" + e.name);
            }
        });
    }

    fs::path source(const std::string& name, const std::string& contents) {
        const auto path = source_dir_ / name;
        write_file(path, contents);
        return path;
    }

    Context context() { return Context(io_, spdlog::default_logger(), &bus_); }

    std::shared_ptr<SendingSession> make_sender(std::vector<fs::path> files, std::size_t chunk_size = 4) {
        auto session = std::make_shared<SendingSession>(context(), endpoints_.first, std::move(files), chunk_size);
        session->done()->on_complete([this](const Result<SessionReport>& r) { send_result_ = r; });
        return session;
    }

    std::shared_ptr<ReceivingSession> make_receiver(dxfer::transfer::SinkProvider& sinks) {
        auto session = std::make_shared<ReceivingSession>(context(), endpoints_.second, sinks);
        session->done()->on_complete([this](const Result<SessionReport>& r) { receive_result_ = r; });
        return session;
    }

    asio::io_context io_;
    EventBus bus_;
    dxfer::events::LoggerComponent logger_{bus_, spdlog::default_logger()};
    dxfer::events::MetricsComponent metrics_{bus_};
    fs::path source_dir_;
    fs::path download_dir_;
    std::pair<std::shared_ptr<LoopbackEndpoints>, std::shared_ptr<LoopbackEndpoints>> endpoints_;
    std::vector<std::string> send_log_;
    std::optional<Result<SessionReport>> send_result_;
    std::optional<Result<SessionReport>> receive_result_;
};

} // namespace

TEST_F(SessionTest, SingleFileArrivesIntact) {
    DownloadDirectory downloads(download_dir_);
    auto receiver = make_receiver(downloads);
    auto sender = make_sender({source("a.bin", std::string("\x01\x02\x03", 3))});

    receiver->start();
    sender->start();
    io_.run();

    ASSERT_TRUE(send_result_.has_value());
    ASSERT_TRUE(send_result_->is_ok()) << send_result_->error().describe();
    ASSERT_EQ(send_result_->value().files_completed(), 1u);
    EXPECT_EQ(send_result_->value().completed[0].sha256, kDigest010203);

    ASSERT_TRUE(receive_result_.has_value());
    ASSERT_TRUE(receive_result_->is_ok()) << receive_result_->error().describe();
    ASSERT_EQ(receive_result_->value().files_completed(), 1u);
    EXPECT_EQ(receive_result_->value().completed[0].sha256, kDigest010203);
    EXPECT_EQ(receive_result_->value().bytes, 3u);

    EXPECT_EQ(read_file(download_dir_ / "a.bin"), std::string("\x01\x02\x03", 3));
    EXPECT_EQ(downloads.in_flight(), 0u);
    EXPECT_TRUE(endpoints_.first->is_closed());
    EXPECT_TRUE(endpoints_.second->is_closed());
}

TEST_F(SessionTest, FilesAreSentStrictlyInOrder) {
    DownloadDirectory downloads(download_dir_);
    auto receiver = make_receiver(downloads);
    auto sender = make_sender({source("one.txt", "first file"),
                               source("two.txt", ""),
                               source("three.txt", std::string(100, 'x'))});

    receiver->start();
    sender->start();
    io_.run();

    ASSERT_TRUE(send_result_.has_value());
    ASSERT_TRUE(send_result_->is_ok()) << send_result_->error().describe();
    EXPECT_EQ(send_log_, (std::vector<std::string>{
        "start:one.txt", "done:one.txt",
        "start:two.txt", "done:two.txt",
        "start:three.txt", "done:three.txt"}));

    EXPECT_EQ(endpoints_.first->streams_opened(), 3u);
    EXPECT_EQ(read_file(download_dir_ / "one.txt"), "first file");
    EXPECT_TRUE(fs::exists(download_dir_ / "two.txt"));
    EXPECT_EQ(fs::file_size(download_dir_ / "two.txt"), 0u);
    EXPECT_EQ(read_file(download_dir_ / "three.txt"), std::string(100, 'x'));

    const auto& stats = metrics_.get_stats();
    EXPECT_EQ(stats.files_sent, 3u);
    EXPECT_EQ(stats.files_received, 3u);
    EXPECT_EQ(stats.bytes_received, 110u);
}

TEST_F(SessionTest, SameNameTwiceGetsSuffix) {
    DownloadDirectory downloads(download_dir_);
    auto receiver = make_receiver(downloads);

    const auto other_dir = create_temp_dir();
    write_file(other_dir / "x.txt", "second");
    auto sender = make_sender({source("x.txt", "first"), other_dir / "x.txt"});

    receiver->start();
    sender->start();
    io_.run();

    ASSERT_TRUE(send_result_.has_value());
    ASSERT_TRUE(send_result_->is_ok());
    EXPECT_EQ(read_file(download_dir_ / "x.txt"), "first");
    EXPECT_EQ(read_file(download_dir_ / "x.txt (1)"), "second");
}

TEST_F(SessionTest, StopsAtTheFirstFailedFile) {
    DownloadDirectory downloads(download_dir_);
    RefusingSinks sinks(downloads, "bad.bin");
    auto receiver = make_receiver(sinks);
    auto sender = make_sender({source("good.bin", "ok"),
                               source("bad.bin", "refused"),
                               source("never.bin", "not attempted")});

    std::size_t receive_failures = 0;
    bus_.subscribe<dxfer::events::TransferFailedEvent>([&](const dxfer::events::TransferFailedEvent& e) {
        if (e.direction == Direction::Receive) {
            ++receive_failures;
        }
    });

    receiver->start();
    sender->start();
    io_.run();

    ASSERT_TRUE(send_result_.has_value());
    ASSERT_TRUE(send_result_->is_error());
    EXPECT_EQ(send_result_->error().kind, ErrorKind::PrematureClose);

    EXPECT_EQ(endpoints_.first->streams_opened(), 2u);
    EXPECT_EQ(send_log_, (std::vector<std::string>{"start:good.bin", "done:good.bin", "start:bad.bin"}));
    EXPECT_EQ(receive_failures, 1u);
    EXPECT_EQ(read_file(download_dir_ / "good.bin"), "ok");
    EXPECT_FALSE(fs::exists(download_dir_ / "never.bin"));

    // The receiver never got "done"
    ASSERT_TRUE(receive_result_.has_value());
    ASSERT_TRUE(receive_result_->is_error());
    EXPECT_EQ(receive_result_->error().kind, ErrorKind::PrematureClose);
}

TEST_F(SessionTest, FailedInboundStreamIsReportedByName) {
    DownloadDirectory downloads(download_dir_);
    RefusingSinks sinks(downloads, "bad.bin");
    auto receiver = make_receiver(sinks);
    receiver->start();

    dxfer::protocol::Ack ack;
    ack.sha256 = kDigest010203;
    const std::size_t ack_size = dxfer::protocol::encode_frame(dxfer::protocol::encode_ack(ack)).size();

    std::shared_ptr<RawReader> bad;
    std::shared_ptr<RawReader> good;
    endpoints_.first->async_open_outbound([&](Result<StreamPtr> opened) {
        ASSERT_TRUE(opened.is_ok());
        bad = std::make_shared<RawReader>(opened.value());
        bad->stream->async_write(
            std::make_shared<const Bytes>(dxfer::protocol::encode_frame(
                dxfer::protocol::encode_header(dxfer::protocol::Header::for_file("bad.bin", 2)))),
            [](const boost::system::error_code&, std::size_t) {});
        bad->start();

        endpoints_.first->async_open_outbound([&](Result<StreamPtr> second) {
            ASSERT_TRUE(second.is_ok());
            Bytes data = dxfer::protocol::encode_frame(
                dxfer::protocol::encode_header(dxfer::protocol::Header::for_file("a.bin", 3)));
            data.insert(data.end(), {0x01, 0x02, 0x03});

            good = std::make_shared<RawReader>(second.value());
            good->on_bytes = [this, ack_size](RawReader& reader) {
                if (reader.received.size() != ack_size) {
                    return;
                }
                reader.stream->close();
                const std::string done = R"({"done":"done"})";
                endpoints_.first->control_stream()->async_write(
                    std::make_shared<const Bytes>(dxfer::protocol::encode_frame(Bytes(done.begin(), done.end()))),
                    [](const boost::system::error_code&, std::size_t) {});
            };
            good->stream->async_write(std::make_shared<const Bytes>(std::move(data)),
                                      [](const boost::system::error_code&, std::size_t) {});
            good->start();
        });
    });

    io_.run();

    ASSERT_TRUE(receive_result_.has_value());
    ASSERT_TRUE(receive_result_->is_ok()) << receive_result_->error().describe();

    const auto& report = receive_result_->value();
    ASSERT_EQ(report.files_completed(), 1u);
    EXPECT_EQ(report.completed[0].name, "a.bin");
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].name, "bad.bin");
    EXPECT_EQ(report.failed[0].size, 2u);
    EXPECT_NE(report.failed[0].last_error.find("disk full"), std::string::npos);
    EXPECT_TRUE(bad->received.empty());
}

TEST_F(SessionTest, MissingSourceStopsBeforeOpeningAStream) {
    DownloadDirectory downloads(download_dir_);
    auto receiver = make_receiver(downloads);
    auto sender = make_sender({source_dir_ / "does-not-exist.bin", source("later.bin", "x")});

    receiver->start();
    sender->start();
    io_.run();

    ASSERT_TRUE(send_result_.has_value());
    ASSERT_TRUE(send_result_->is_error());
    EXPECT_EQ(send_result_->error().kind, ErrorKind::Io);
    EXPECT_EQ(endpoints_.first->streams_opened(), 0u);
    EXPECT_TRUE(send_log_.empty());
}

TEST_F(SessionTest, WireBytesForSingleFileThenDone) {
    auto sender = make_sender({source("a.bin", std::string("\x01\x02\x03", 3))});

    Bytes expected_stream = dxfer::protocol::encode_frame(
        dxfer::protocol::encode_header(dxfer::protocol::Header::for_file("a.bin", 3)));
    expected_stream.insert(expected_stream.end(), {0x01, 0x02, 0x03});

    std::shared_ptr<RawReader> transfer;
    endpoints_.second->listen([&](StreamPtr stream) {
        transfer = std::make_shared<RawReader>(std::move(stream));
        transfer->on_bytes = [&expected_stream](RawReader& reader) {
            if (reader.received.size() != expected_stream.size()) {
                return;
            }
            dxfer::protocol::Ack ack;
            ack.sha256 = kDigest010203;
            reader.stream->async_write(
                std::make_shared<const Bytes>(dxfer::protocol::encode_frame(dxfer::protocol::encode_ack(ack))),
                [](const boost::system::error_code&, std::size_t) {});
        };
        transfer->start();
    });

    auto control = std::make_shared<RawReader>(endpoints_.second->control_stream());
    control->start();

    sender->start();
    io_.run();

    ASSERT_TRUE(send_result_.has_value());
    ASSERT_TRUE(send_result_->is_ok()) << send_result_->error().describe();

    ASSERT_NE(transfer, nullptr);
    EXPECT_EQ(transfer->received, expected_stream);

    const std::string done = R"({"done":"done"})";
    Bytes expected_control{0, 0, 0, 0, 0, 0, 0, 15};
    expected_control.insert(expected_control.end(), done.begin(), done.end());
    EXPECT_EQ(control->received, expected_control);
}

TEST_F(SessionTest, BadAckFailsTheSender) {
    auto sender = make_sender({source("a.bin", std::string("\x01\x02\x03", 3)), source("b.bin", "b")});

    const std::size_t full_stream = dxfer::protocol::encode_frame(
        dxfer::protocol::encode_header(dxfer::protocol::Header::for_file("a.bin", 3))).size() + 3;

    std::shared_ptr<RawReader> transfer;
    endpoints_.second->listen([&](StreamPtr stream) {
        transfer = std::make_shared<RawReader>(std::move(stream));
        transfer->on_bytes = [full_stream](RawReader& reader) {
            if (reader.received.size() != full_stream) {
                return;
            }
            dxfer::protocol::Ack ack;
            ack.sha256 = std::string(64, 'f');
            reader.stream->async_write(
                std::make_shared<const Bytes>(dxfer::protocol::encode_frame(dxfer::protocol::encode_ack(ack))),
                [](const boost::system::error_code&, std::size_t) {});
        };
        transfer->start();
    });

    sender->start();
    io_.run();

    ASSERT_TRUE(send_result_.has_value());
    ASSERT_TRUE(send_result_->is_error());
    EXPECT_EQ(send_result_->error().kind, ErrorKind::IntegrityFailure);
    EXPECT_EQ(endpoints_.first->streams_opened(), 1u);
    EXPECT_EQ(send_log_, (std::vector<std::string>{"start:a.bin"}));
}

TEST_F(SessionTest, FailedInboundStreamDoesNotAffectOthers) {
    DownloadDirectory downloads(download_dir_);
    auto receiver = make_receiver(downloads);
    receiver->start();

    const std::string garbage = "not a header";
    endpoints_.first->async_open_outbound([&](Result<StreamPtr> opened) {
        ASSERT_TRUE(opened.is_ok());
        auto stream = opened.value();
        stream->async_write(
            std::make_shared<const Bytes>(dxfer::protocol::encode_frame(Bytes(garbage.begin(), garbage.end()))),
            [](const boost::system::error_code&, std::size_t) {});
        stream->close();
    });

    dxfer::protocol::Ack ack;
    ack.sha256 = kDigest010203;
    const std::size_t ack_size = dxfer::protocol::encode_frame(dxfer::protocol::encode_ack(ack)).size();

    std::shared_ptr<RawReader> good;
    endpoints_.first->async_open_outbound([&](Result<StreamPtr> opened) {
        ASSERT_TRUE(opened.is_ok());
        Bytes data = dxfer::protocol::encode_frame(
            dxfer::protocol::encode_header(dxfer::protocol::Header::for_file("a.bin", 3)));
        data.insert(data.end(), {0x01, 0x02, 0x03});

        good = std::make_shared<RawReader>(opened.value());
        good->on_bytes = [this, ack_size](RawReader& reader) {
            if (reader.received.size() != ack_size) {
                return;
            }
            reader.stream->close();
            const std::string done = R"({"done":"done"})";
            endpoints_.first->control_stream()->async_write(
                std::make_shared<const Bytes>(dxfer::protocol::encode_frame(Bytes(done.begin(), done.end()))),
                [](const boost::system::error_code&, std::size_t) {});
        };
        good->stream->async_write(std::make_shared<const Bytes>(std::move(data)),
                                  [](const boost::system::error_code&, std::size_t) {});
        good->start();
    });

    io_.run();

    ASSERT_TRUE(receive_result_.has_value());
    ASSERT_TRUE(receive_result_->is_ok()) << receive_result_->error().describe();
    EXPECT_EQ(receiver->streams_accepted(), 2u);

    const auto& report = receive_result_->value();
    ASSERT_EQ(report.files_completed(), 1u);
    EXPECT_EQ(report.completed[0].name, "a.bin");
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_FALSE(report.failed[0].last_error.empty());

    EXPECT_EQ(read_file(download_dir_ / "a.bin"), std::string("\x01\x02\x03", 3));
    EXPECT_EQ(downloads.in_flight(), 0u);
}

TEST_F(SessionTest, TransferCutShortByDoneIsReportedAsFailed) {
    DownloadDirectory downloads(download_dir_);
    auto receiver = make_receiver(downloads);
    receiver->start();

    endpoints_.first->async_open_outbound([&](Result<StreamPtr> opened) {
        ASSERT_TRUE(opened.is_ok());
        Bytes data = dxfer::protocol::encode_frame(
            dxfer::protocol::encode_header(dxfer::protocol::Header::for_file("partial.bin", 10)));
        data.insert(data.end(), {0x01, 0x02, 0x03});
        opened.value()->async_write(std::make_shared<const Bytes>(std::move(data)),
                                    [](const boost::system::error_code&, std::size_t) {});

        const std::string done = R"({"done":"done"})";
        endpoints_.first->control_stream()->async_write(
            std::make_shared<const Bytes>(dxfer::protocol::encode_frame(Bytes(done.begin(), done.end()))),
            [](const boost::system::error_code&, std::size_t) {});
    });

    io_.run();

    ASSERT_TRUE(receive_result_.has_value());
    ASSERT_TRUE(receive_result_->is_ok()) << receive_result_->error().describe();
    EXPECT_EQ(receiver->streams_accepted(), 1u);

    const auto& report = receive_result_->value();
    EXPECT_EQ(report.files_completed(), 0u);
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].name, "partial.bin");
    EXPECT_EQ(report.failed[0].destination, (download_dir_ / "partial.bin").string());
    EXPECT_NE(report.failed[0].last_error.find("premature close"), std::string::npos);

    EXPECT_FALSE(fs::exists(download_dir_ / "partial.bin"));
    EXPECT_FALSE(fs::exists(download_dir_ / ".partial.bin.part"));
    EXPECT_EQ(downloads.in_flight(), 0u);
}
