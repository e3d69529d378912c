#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "common/bounded_queue.hpp"
#include "common/cancellation.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "crypto/checksum_parser.hpp"
#include "crypto/hasher.hpp"
#include "files/file_utils.hpp"
#include "files/job.hpp"
#include "files/job_validator.hpp"
#include "files/progress_hub.hpp"
#include "network/http_client.hpp"
#include "storage/storage_manager.hpp"
#include "nlohmann/json.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

fs::path make_temp_dir(const std::string& prefix) {
    fs::path dir = fs::temp_directory_path() / (prefix + JobNaming::generate_id());
    fs::create_directories(dir);
    return dir;
}

Job sample_job() {
    Job job;
    job.id = JobNaming::generate_id();
    job.name = "alpine";
    job.version = "3.19.1";
    job.arch = "x86_64";
    job.file_type = "iso";
    job.download_url = "https://dl.example.org/alpine/alpine-standard-3.19.1-x86_64.iso";
    job.created_at = std::chrono::system_clock::now();
    job.compute_fields();
    return job;
}

} // namespace

// --- Hasher ---

TEST(HasherTest, Sha256String) {
    ASSERT_EQ(Hasher::digest("Hello, World!", ChecksumAlgorithm::SHA256),
              "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");
}

TEST(HasherTest, Md5String) {
    ASSERT_EQ(Hasher::digest("Hello, World!", ChecksumAlgorithm::MD5),
              "65a8e27d8879283831b664bd8b7f0ad4");
}

TEST(HasherTest, Sha512String) {
    ASSERT_EQ(Hasher::digest("Hello, World!", ChecksumAlgorithm::SHA512),
              "374d794a95cdcfd8b35993185fef9ba368f160d8daf432d08ba9f1ed1e5abe6c"
              "c69291e0fa2fe0006a52570ef18c19def4e617c33ce52ef0a6e5fbe318cb0387");
}

TEST(HasherTest, ParseAlgorithmIsCaseInsensitive) {
    EXPECT_EQ(Hasher::parse_algorithm("SHA256"), ChecksumAlgorithm::SHA256);
    EXPECT_EQ(Hasher::parse_algorithm("Sha512"), ChecksumAlgorithm::SHA512);
    EXPECT_EQ(Hasher::parse_algorithm("md5"), ChecksumAlgorithm::MD5);
    EXPECT_TRUE(Hasher::is_supported_algorithm("MD5"));
    EXPECT_FALSE(Hasher::is_supported_algorithm("sha1"));
}

TEST(HasherTest, UnsupportedAlgorithmThrows) {
    try {
        Hasher::parse_algorithm("crc32");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "unsupported hash type: crc32");
    }
}

// Streaming must agree with the in-memory digest across block boundaries.
TEST(HasherTest, FileDigestMatchesInMemoryDigest) {
    fs::path dir = make_temp_dir("isofetch_hash_");
    fs::path file = dir / "payload.bin";
    std::string data;
    for (int i = 0; i < 200000; ++i) data.push_back(static_cast<char>(i * 31));
    {
        std::ofstream out(file, std::ios::binary);
        out << data;
    }

    EXPECT_EQ(Hasher::file_digest(file, "sha256"), Hasher::digest(data, ChecksumAlgorithm::SHA256));
    EXPECT_EQ(Hasher::file_digest(file, ChecksumAlgorithm::MD5), Hasher::digest(data, ChecksumAlgorithm::MD5));
    fs::remove_all(dir);
}

TEST(HasherTest, FileDigestHonoursCancellation) {
    fs::path dir = make_temp_dir("isofetch_hash_");
    fs::path file = dir / "payload.bin";
    {
        std::ofstream out(file, std::ios::binary);
        out << std::string(1024, 'x');
    }
    CancellationSource source;
    source.cancel("download cancelled");
    EXPECT_THROW(Hasher::file_digest(file, ChecksumAlgorithm::SHA256, source.token()), CancelledError);
    fs::remove_all(dir);
}

TEST(HasherTest, FileDigestMissingFileThrows) {
    EXPECT_THROW(Hasher::file_digest("/nonexistent/isofetch/file.iso", "sha256"), std::runtime_error);
}

// --- ChecksumParser ---

TEST(ChecksumParserTest, StandardFormat) {
    std::string text =
        "# SHA256 checksums\n"
        "\n"
        "aaaa1111  other.iso\n"
        "ABCDEF0123456789  alpine.iso\n";
    EXPECT_EQ(ChecksumParser::find_checksum(text, "alpine.iso"), "abcdef0123456789");
}

TEST(ChecksumParserTest, BinaryMarkerIsStripped) {
    std::string text = "0123abcd *ubuntu-24.04-live-server-amd64.iso\r\n";
    EXPECT_EQ(ChecksumParser::find_checksum(text, "ubuntu-24.04-live-server-amd64.iso"), "0123abcd");
}

TEST(ChecksumParserTest, BsdFormatWithLooseWhitespace) {
    std::string text =
        "SHA256 (debian.iso) = 00ff\n"
        "SHA512 ( fedora.iso )   =   DEADBEEF  \n";
    EXPECT_EQ(ChecksumParser::find_checksum(text, "debian.iso"), "00ff");
    EXPECT_EQ(ChecksumParser::find_checksum(text, "fedora.iso"), "deadbeef");

    auto entry = ChecksumParser::parse_line("MD5 (a.img) = 12ab");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->algorithm, "MD5");
    EXPECT_EQ(entry->filename, "a.img");
}

TEST(ChecksumParserTest, MixedFormatsFirstMatchWins) {
    std::string text =
        "SHA256 (dup.iso) = 1111\n"
        "2222  dup.iso\n";
    EXPECT_EQ(ChecksumParser::find_checksum(text, "dup.iso"), "1111");
}

TEST(ChecksumParserTest, FilenameMatchIsExact) {
    std::string text = "1111  images/dup.iso\n2222  DUP.ISO\n";
    EXPECT_THROW(ChecksumParser::find_checksum(text, "dup.iso"), ChecksumNotFoundError);
}

TEST(ChecksumParserTest, MissingEntryThrows) {
    try {
        ChecksumParser::find_checksum("", "alpine.iso");
        FAIL() << "expected ChecksumNotFoundError";
    } catch (const ChecksumNotFoundError& e) {
        EXPECT_STREQ(e.what(), "checksum not found for file: alpine.iso");
    }
}

TEST(ChecksumParserTest, RejectsMalformedLines) {
    EXPECT_FALSE(ChecksumParser::parse_line("not-hex alpine.iso").has_value());
    EXPECT_FALSE(ChecksumParser::parse_line("abcdef").has_value());
    EXPECT_FALSE(ChecksumParser::parse_line("SHA 256 (x.iso) = ab").has_value());
    EXPECT_FALSE(ChecksumParser::parse_line("SHA256 (x.iso) ab").has_value());
    EXPECT_FALSE(ChecksumParser::parse_line("   # comment").has_value());
}

// --- Job model ---

TEST(JobTest, NormalizeName) {
    EXPECT_EQ(JobNaming::normalize_name("Alpine Linux"), "alpine-linux");
    EXPECT_EQ(JobNaming::normalize_name("  Ubuntu Server 24.04 "), "ubuntu-server-24-04");
    EXPECT_EQ(JobNaming::normalize_name("Rocky/Linux!!"), "rocky-linux");
    EXPECT_EQ(JobNaming::normalize_name("--a...b--"), "a-b");
    EXPECT_EQ(JobNaming::normalize_name("!!!"), "");
}

TEST(JobTest, ComputeFields) {
    Job job = sample_job();
    job.edition = "minimal";
    job.compute_fields();
    EXPECT_EQ(job.filename, "alpine-3.19.1-minimal-x86_64.iso");
    EXPECT_EQ(job.file_path, "alpine/3.19.1/x86_64/alpine-3.19.1-minimal-x86_64.iso");
    EXPECT_EQ(job.download_link, "/images/alpine/3.19.1/x86_64/alpine-3.19.1-minimal-x86_64.iso");
    EXPECT_EQ(job.original_filename(), "alpine-standard-3.19.1-x86_64.iso");
}

TEST(JobTest, DetectFileType) {
    EXPECT_EQ(JobNaming::detect_file_type("https://x.org/a/disk.QCOW2"), "qcow2");
    EXPECT_EQ(JobNaming::detect_file_type("https://x.org/a/disk.img?token=1"), "img");
    EXPECT_THROW(JobNaming::detect_file_type("https://x.org/a/archive.zip"), ValidationError);
    EXPECT_THROW(JobNaming::detect_file_type("https://x.org/a/noext"), ValidationError);
}

TEST(JobTest, StatusNamesRoundTrip) {
    for (JobStatus s : {JobStatus::Pending, JobStatus::Downloading, JobStatus::Verifying,
                        JobStatus::Complete, JobStatus::Failed}) {
        auto parsed = parse_job_status(to_string(s));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, s);
    }
    EXPECT_FALSE(parse_job_status("paused").has_value());
}

TEST(JobTest, Transitions) {
    EXPECT_TRUE(is_valid_transition(JobStatus::Pending, JobStatus::Downloading));
    EXPECT_TRUE(is_valid_transition(JobStatus::Downloading, JobStatus::Verifying));
    EXPECT_TRUE(is_valid_transition(JobStatus::Verifying, JobStatus::Complete));
    EXPECT_TRUE(is_valid_transition(JobStatus::Failed, JobStatus::Pending));
    EXPECT_FALSE(is_valid_transition(JobStatus::Complete, JobStatus::Downloading));
    EXPECT_FALSE(is_valid_transition(JobStatus::Verifying, JobStatus::Downloading));
    EXPECT_TRUE(is_cancellable(JobStatus::Verifying));
    EXPECT_FALSE(is_cancellable(JobStatus::Pending));
}

TEST(JobTest, GenerateIdIsUuidV4) {
    std::string a = JobNaming::generate_id();
    std::string b = JobNaming::generate_id();
    EXPECT_NE(a, b);
    ASSERT_EQ(a.size(), 36u);
    EXPECT_EQ(a[8], '-');
    EXPECT_EQ(a[14], '4');
    EXPECT_THAT(std::string("89ab"), HasSubstr(std::string(1, a[19])));
}

// --- JobValidator ---

TEST(JobValidatorTest, AcceptsValidJob) {
    Job job = sample_job();
    job.checksum_url = "https://dl.example.org/alpine/SHA256SUMS";
    job.checksum_type = "sha256";
    EXPECT_TRUE(JobValidator::check(job).empty());
    EXPECT_NO_THROW(JobValidator::validate(job));
}

TEST(JobValidatorTest, CollectsEveryFieldError) {
    Job job = sample_job();
    job.name = " ";
    job.arch = std::string(21, 'a');
    job.download_url = "ftp://example.org/x.iso";
    job.checksum_url = "https://example.org/SUMS";
    job.checksum_type = "";

    auto errors = JobValidator::check(job);
    ASSERT_EQ(errors.size(), 4u);
    EXPECT_EQ(errors[0].field, "name");
    EXPECT_EQ(errors[1].field, "arch");
    EXPECT_EQ(errors[2].field, "download_url");
    EXPECT_EQ(errors[3].field, "checksum_type");

    try {
        JobValidator::validate(job);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_THAT(e.what(), StartsWith("name: name is required; arch: "));
        EXPECT_THAT(e.what(), HasSubstr("checksum_type is required when checksum_url is set"));
    }
}

TEST(JobValidatorTest, RejectsUnsupportedChecksumAndFileType) {
    Job job = sample_job();
    job.checksum_type = "sha1";
    job.file_type = "zip";
    auto errors = JobValidator::check(job);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].field, "checksum_type");
    EXPECT_EQ(errors[1].field, "file_type");
}

TEST(JobValidatorTest, HttpUrl) {
    EXPECT_TRUE(JobValidator::is_http_url("http://a"));
    EXPECT_TRUE(JobValidator::is_http_url("HTTPS://mirror.example.org/x.iso"));
    EXPECT_FALSE(JobValidator::is_http_url("https://"));
    EXPECT_FALSE(JobValidator::is_http_url("file:///etc/passwd"));
}

// --- Cancellation ---

TEST(CancellationTest, CancelIsReportedOnce) {
    CancellationSource source;
    CancellationToken token = source.token();
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_TRUE(token.reason().empty());

    EXPECT_TRUE(source.cancel("download cancelled"));
    EXPECT_FALSE(source.cancel("again"));
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_EQ(token.reason(), "download cancelled");
    EXPECT_THROW(token.throw_if_cancelled(), CancelledError);
}

TEST(CancellationTest, ParentCancelsChildButNotTheReverse) {
    CancellationSource root;
    CancellationSource child(root.token());
    CancellationSource sibling(root.token());

    child.cancel("download cancelled");
    EXPECT_TRUE(child.token().is_cancelled());
    EXPECT_FALSE(sibling.token().is_cancelled());
    EXPECT_FALSE(root.token().is_cancelled());

    root.cancel("download cancelled: shutting down");
    EXPECT_TRUE(sibling.token().is_cancelled());
    EXPECT_EQ(sibling.token().reason(), "download cancelled: shutting down");
    // The nearest cancelled scope supplies the reason.
    EXPECT_EQ(child.token().reason(), "download cancelled");
}

TEST(CancellationTest, DeadlineExpires) {
    CancellationSource source;
    CancellationToken limited = source.token().with_timeout(std::chrono::milliseconds(30));
    EXPECT_FALSE(limited.is_cancelled());
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_TRUE(limited.is_cancelled());
    EXPECT_TRUE(limited.deadline_exceeded());
    EXPECT_EQ(limited.reason(), "deadline exceeded");
    EXPECT_FALSE(source.token().is_cancelled());
}

TEST(CancellationTest, CommitRefusesLaterCancel) {
    CancellationSource source;
    CancellationToken token = source.token();
    EXPECT_TRUE(token.try_commit());
    EXPECT_FALSE(source.cancel("download cancelled"));
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_TRUE(token.reason().empty());
}

TEST(CancellationTest, CommitFailsOnceCancelled) {
    CancellationSource root;
    CancellationSource job(root.token());
    root.cancel("download cancelled: shutting down");
    EXPECT_FALSE(job.token().try_commit());

    CancellationSource other;
    other.cancel("download cancelled");
    EXPECT_FALSE(other.token().try_commit());
    EXPECT_TRUE(CancellationToken().try_commit());
}

TEST(CancellationTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_NO_THROW(token.throw_if_cancelled());
}

// --- BoundedQueue ---

TEST(BoundedQueueTest, FifoAndCapacity) {
    BoundedQueue<int> queue(2);
    EXPECT_TRUE(queue.try_push(1));
    EXPECT_TRUE(queue.try_push(2));
    EXPECT_FALSE(queue.try_push(3));
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
}

TEST(BoundedQueueTest, PushBlocksUntilSpace) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        queue.push(2);
        pushed = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed.load());

    EXPECT_EQ(queue.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.pop(), 2);
}

TEST(BoundedQueueTest, CloseWakesWaitersAndDropsItems) {
    BoundedQueue<int> queue(4);
    queue.push(1);
    queue.push(2);
    EXPECT_EQ(queue.close(), 2u);
    EXPECT_FALSE(queue.push(3));
    EXPECT_FALSE(queue.pop().has_value());

    BoundedQueue<int> empty(1);
    std::thread consumer([&] { EXPECT_FALSE(empty.pop().has_value()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    empty.close();
    consumer.join();
}

// --- Config ---

TEST(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.download.worker_count, 2u);
    EXPECT_EQ(config.download.queue_buffer, 100u);
    EXPECT_EQ(config.download.buffer_size, 32u * 1024);
    EXPECT_EQ(config.download.max_retries, 5);
    EXPECT_EQ(config.download.retry_delay.count(), 100);
    EXPECT_EQ(config.download.checksum_timeout.count(), 30000);
    EXPECT_EQ(config.db_path(), fs::path("./data") / "db" / "isos.db");
    EXPECT_EQ(config.tmp_dir(), fs::path("./data") / "isos" / ".tmp");
}

TEST(ConfigTest, MergeJson) {
    Config config;
    config.merge_json(R"({
        "data_dir": "/srv/isos",
        "download": {"worker_count": 4, "retry_delay_ms": 250, "progress_percent_threshold": 5},
        "database": {"journal_mode": "DELETE"},
        "http": {"verify_tls": false},
        "log": {"level": "debug"}
    })");
    EXPECT_EQ(config.data_dir, "/srv/isos");
    EXPECT_EQ(config.download.worker_count, 4u);
    EXPECT_EQ(config.download.retry_delay.count(), 250);
    EXPECT_EQ(config.download.progress_percent_threshold, 5);
    EXPECT_EQ(config.database.journal_mode, "DELETE");
    EXPECT_FALSE(config.http.verify_tls);
    EXPECT_EQ(config.log.level, "debug");
    EXPECT_EQ(config.download.queue_buffer, 100u);
}

TEST(ConfigTest, MalformedJsonThrows) {
    Config config;
    EXPECT_THROW(config.merge_json("{ not json"), ConfigError);
    EXPECT_THROW(config.merge_json("[1, 2]"), ConfigError);
    EXPECT_THROW(config.merge_json(R"({"download": {"worker_count": "many"}})"), ConfigError);
}

TEST(ConfigTest, EnvironmentOverrides) {
    setenv("WORKER_COUNT", "7", 1);
    setenv("RETRY_DELAY_MS", "5", 1);
    setenv("QUEUE_BUFFER", "not-a-number", 1);
    setenv("VERIFY_TLS", "false", 1);

    Config config;
    config.apply_env();
    EXPECT_EQ(config.download.worker_count, 7u);
    EXPECT_EQ(config.download.retry_delay.count(), 5);
    EXPECT_EQ(config.download.queue_buffer, 100u);
    EXPECT_FALSE(config.http.verify_tls);

    unsetenv("WORKER_COUNT");
    unsetenv("RETRY_DELAY_MS");
    unsetenv("QUEUE_BUFFER");
    unsetenv("VERIFY_TLS");
}

// --- Url ---

TEST(UrlTest, Parse) {
    Url url = Url::parse("https://mirror.example.org/pub/alpine.iso?x=1#frag");
    EXPECT_EQ(url.scheme, "https");
    EXPECT_EQ(url.host, "mirror.example.org");
    EXPECT_EQ(url.port, 443);
    EXPECT_EQ(url.target, "/pub/alpine.iso?x=1");
    EXPECT_EQ(url.host_header(), "mirror.example.org");

    Url local = Url::parse("http://127.0.0.1:8080");
    EXPECT_EQ(local.port, 8080);
    EXPECT_EQ(local.target, "/");
    EXPECT_EQ(local.host_header(), "127.0.0.1:8080");

    EXPECT_THROW(Url::parse("ftp://example.org/x"), HttpError);
    EXPECT_THROW(Url::parse("example.org/x"), HttpError);
    EXPECT_THROW(Url::parse("http://host:99999/"), HttpError);
}

TEST(UrlTest, ResolveRedirects) {
    Url base = Url::parse("http://a.example/dir/file.iso");
    EXPECT_EQ(base.resolve("/other.iso").to_string(), "http://a.example/other.iso");
    EXPECT_EQ(base.resolve("next.iso").to_string(), "http://a.example/dir/next.iso");
    EXPECT_EQ(base.resolve("//b.example/x.iso").to_string(), "http://b.example/x.iso");
    EXPECT_EQ(base.resolve("https://c.example/y.iso").to_string(), "https://c.example/y.iso");
}

// --- ProgressHub ---

class ProgressHubTest : public ::testing::Test {
protected:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> received_;

    bool wait_for_messages(size_t count) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(5), [&] { return received_.size() >= count; });
    }

    ProgressHub::Subscriber recorder() {
        return [this](const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back(message);
            cv_.notify_all();
        };
    }
};

TEST_F(ProgressHubTest, DeliversJsonToSubscribers) {
    ProgressHub hub(16);
    auto id = hub.subscribe(recorder());
    EXPECT_EQ(hub.subscriber_count(), 1u);

    hub.notify("job-1", 42, JobStatus::Downloading);
    ASSERT_TRUE(wait_for_messages(1));

    auto message = nlohmann::json::parse(received_[0]);
    EXPECT_EQ(message["type"], "progress");
    EXPECT_EQ(message["payload"]["id"], "job-1");
    EXPECT_EQ(message["payload"]["progress"], 42);
    EXPECT_EQ(message["payload"]["status"], "downloading");

    EXPECT_TRUE(hub.unsubscribe(id));
    EXPECT_FALSE(hub.unsubscribe(id));
}

TEST_F(ProgressHubTest, ThrowingSubscriberIsKept) {
    ProgressHub hub(16);
    hub.subscribe([](const std::string&) { throw std::runtime_error("socket closed"); });
    hub.subscribe(recorder());

    hub.notify("job-1", 1, JobStatus::Downloading);
    hub.notify("job-1", 2, JobStatus::Downloading);
    ASSERT_TRUE(wait_for_messages(2));
    EXPECT_EQ(hub.subscriber_count(), 2u);
}

TEST_F(ProgressHubTest, DropsWhenBufferIsFull) {
    ProgressHub hub(1);
    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool entered = false;
    bool release = false;

    hub.subscribe([&](const std::string&) {
        std::unique_lock<std::mutex> lock(gate_mutex);
        entered = true;
        gate_cv.notify_all();
        gate_cv.wait(lock, [&] { return release; });
    });

    hub.notify("job-1", 1, JobStatus::Downloading);
    {
        std::unique_lock<std::mutex> lock(gate_mutex);
        ASSERT_TRUE(gate_cv.wait_for(lock, std::chrono::seconds(5), [&] { return entered; }));
    }

    // The delivery thread is stuck in the subscriber: one slot, then drops.
    hub.notify("job-1", 2, JobStatus::Downloading);
    hub.notify("job-1", 3, JobStatus::Downloading);
    hub.notify("job-1", 4, JobStatus::Downloading);
    EXPECT_EQ(hub.dropped_count(), 2u);

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        release = true;
    }
    gate_cv.notify_all();
    hub.stop();
}

// --- StorageManager ---

class StorageManagerTest : public ::testing::Test {
protected:
    fs::path dir_;
    std::unique_ptr<StorageManager> store_;

    void SetUp() override {
        dir_ = make_temp_dir("isofetch_store_");
        store_ = std::make_unique<StorageManager>((dir_ / "db" / "isos.db").string());
        ASSERT_TRUE(store_->is_open());
    }

    void TearDown() override {
        store_.reset();
        fs::remove_all(dir_);
    }
};

TEST_F(StorageManagerTest, CreateAndGet) {
    Job job = sample_job();
    job.checksum_url = "https://dl.example.org/SHA256SUMS";
    job.checksum_type = "sha256";
    ASSERT_TRUE(store_->create_job(job));

    auto loaded = store_->get_job(job.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->filename, job.filename);
    EXPECT_EQ(loaded->checksum_url, job.checksum_url);
    EXPECT_EQ(loaded->status, JobStatus::Pending);
    EXPECT_FALSE(loaded->completed_at.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(loaded->created_at.time_since_epoch()),
              std::chrono::duration_cast<std::chrono::milliseconds>(job.created_at.time_since_epoch()));

    EXPECT_FALSE(store_->get_job("missing").has_value());
}

TEST_F(StorageManagerTest, DuplicateIdentityIsRejected) {
    Job job = sample_job();
    ASSERT_TRUE(store_->create_job(job));

    auto existing = store_->find_existing(job.name, job.version, job.arch, job.edition, job.file_type);
    ASSERT_TRUE(existing.has_value());
    EXPECT_EQ(*existing, job.id);

    Job copy = job;
    copy.id = JobNaming::generate_id();
    EXPECT_FALSE(store_->create_job(copy));
    EXPECT_FALSE(store_->find_existing(job.name, "9.9", job.arch, job.edition, job.file_type).has_value());
}

TEST_F(StorageManagerTest, PartialUpdates) {
    Job job = sample_job();
    ASSERT_TRUE(store_->create_job(job));

    EXPECT_TRUE(store_->update_progress(job.id, 40, JobStatus::Downloading));
    EXPECT_TRUE(store_->update_size(job.id, 1234));
    EXPECT_TRUE(store_->update_checksum(job.id, "abcd"));
    EXPECT_TRUE(store_->update_status(job.id, JobStatus::Failed, "boom"));

    auto loaded = store_->get_job(job.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->progress, 40);
    EXPECT_EQ(loaded->size_bytes, 1234);
    EXPECT_EQ(loaded->checksum, "abcd");
    EXPECT_EQ(loaded->status, JobStatus::Failed);
    EXPECT_EQ(loaded->error_message, "boom");

    EXPECT_FALSE(store_->update_progress("missing", 1, JobStatus::Downloading));
}

TEST_F(StorageManagerTest, UpdateJobAndDelete) {
    Job job = sample_job();
    ASSERT_TRUE(store_->create_job(job));

    job.status = JobStatus::Complete;
    job.progress = 100;
    job.completed_at = std::chrono::system_clock::now();
    ASSERT_TRUE(store_->update_job(job));

    auto loaded = store_->get_job(job.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->status, JobStatus::Complete);
    EXPECT_TRUE(loaded->completed_at.has_value());

    EXPECT_TRUE(store_->delete_job(job.id));
    EXPECT_FALSE(store_->delete_job(job.id));
    EXPECT_TRUE(store_->list_jobs().empty());
}

TEST_F(StorageManagerTest, FailInterrupted) {
    Job downloading = sample_job();
    Job verifying = sample_job();
    verifying.version = "3.20.0";
    verifying.compute_fields();
    Job pending = sample_job();
    pending.version = "3.21.0";
    pending.compute_fields();

    ASSERT_TRUE(store_->create_job(downloading));
    ASSERT_TRUE(store_->create_job(verifying));
    ASSERT_TRUE(store_->create_job(pending));
    store_->update_progress(downloading.id, 30, JobStatus::Downloading);
    store_->update_progress(verifying.id, 100, JobStatus::Verifying);

    EXPECT_EQ(store_->fail_interrupted("interrupted by restart"), 2u);
    EXPECT_EQ(store_->get_job(downloading.id)->status, JobStatus::Failed);
    EXPECT_EQ(store_->get_job(downloading.id)->progress, 30);
    EXPECT_EQ(store_->get_job(verifying.id)->error_message, "interrupted by restart");
    EXPECT_EQ(store_->get_job(pending.id)->status, JobStatus::Pending);
    EXPECT_EQ(store_->list_jobs().size(), 3u);
}

// --- FileUtils ---

TEST(FileUtilsTest, Paths) {
    Job job = sample_job();
    fs::path isos = "/data/isos";
    EXPECT_EQ(FileUtils::temp_path(isos, job), isos / ".tmp" / (job.id + "_" + job.filename));
    EXPECT_EQ(FileUtils::final_path(isos, job), isos / "alpine" / "3.19.1" / "x86_64" / job.filename);
    EXPECT_EQ(FileUtils::sidecar_path("/x/a.iso", "sha256"), fs::path("/x/a.iso.sha256"));
    EXPECT_EQ(FileUtils::sidecar_candidates("/x/a.iso").size(), 3u);
}

TEST(FileUtilsTest, DeleteIfExists) {
    fs::path dir = make_temp_dir("isofetch_files_");
    fs::path file = dir / "a.iso";
    std::ofstream(file) << "x";
    EXPECT_TRUE(FileUtils::delete_if_exists(file));
    EXPECT_FALSE(fs::exists(file));
    EXPECT_TRUE(FileUtils::delete_if_exists(file));
    fs::remove_all(dir);
}
