#include <gtest/gtest.h>
#include "files/FileManager.hpp"
#include "crypto/hash.hpp"
#include "files/RecordStore.hpp"
#include "files/errors.hpp"
#include "storage/LocalDiskBackend.hpp"
#include "security/VirusScanner.hpp"
#include "TestEnv.hpp"
#include "TestStreams.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;
using namespace fk;
using namespace fk::files;
using namespace std::chrono_literals;
using model::Status;
using model::Type;

namespace {

constexpr auto HELLO_SHA256 = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
constexpr auto HELLO_BLAKE2B = "324dcf027dd4a30a932c441f365a25e86b173defa4b8e58948253471b81b72cf";

std::string slurp(std::istream& in) {
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

template <typename Pred>
bool waitFor(Pred&& pred, const std::chrono::milliseconds timeout = 3s) {
    const auto until = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > until) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

}

class FileManagerTest : public ::testing::Test {
protected:
    test::TempDir tmp{"manager"};
    config::FileManagerConfig cfg = test::makeConfig(tmp.path);

    std::unique_ptr<FileManager> open() { return std::make_unique<FileManager>(cfg); }

    model::Record put(FileManager& fm, const std::string& name, const std::string& body,
                      const UploadOptions& opts = {}) {
        std::istringstream in(body);
        return fm.uploadFile(in, name, nlohmann::json::object(), opts);
    }
};

TEST_F(FileManagerTest, UploadSmallTextFile) {
    cfg.max_file_size = 10;
    const auto fm = open();

    const auto rec = put(*fm, "hello.txt", "hello");
    EXPECT_EQ(rec.status, Status::Ready);
    EXPECT_EQ(rec.size_bytes, 5u);
    EXPECT_EQ(rec.type, Type::Text);
    EXPECT_EQ(rec.mime_type, "text/plain");
    EXPECT_EQ(rec.extension, ".txt");
    EXPECT_EQ(rec.checksum, HELLO_SHA256);
    EXPECT_EQ(rec.content_hash, HELLO_BLAKE2B);
    EXPECT_EQ(rec.name, "hello.txt");
    EXPECT_FALSE(rec.thumbnail.has_value());

    ASSERT_TRUE(rec.preview.has_value());
    EXPECT_EQ(rec.preview->kind, "text");
    EXPECT_EQ(slurp(*fm->getPreview(rec.id)), "hello");

    const auto info = fm->getFileInfo(rec.id);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->checksum, HELLO_SHA256);
    EXPECT_FALSE(fm->getUploadProgress(rec.id).has_value());
}

TEST_F(FileManagerTest, OversizedUploadFailsWithoutPartials) {
    cfg.max_file_size = 10;
    const auto fm = open();

    EXPECT_THROW(put(*fm, "big.txt", "hello world"), SizeLimitExceeded);

    const auto failed = fm->listFiles({.status = Status::Error});
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].name, "big.txt");
    EXPECT_EQ(test::regularFilesIn(cfg.storage_dir), 0u);
    EXPECT_EQ(fm->slotsInUse(), 0u);
    EXPECT_THROW(fm->downloadFile(failed[0].id), NotReady);
}

TEST_F(FileManagerTest, SameBytesSameDigests) {
    const auto fm = open();
    const auto a = put(*fm, "a.txt", "identical");
    const auto b = put(*fm, "b.txt", "identical");
    EXPECT_NE(a.id, b.id);
    EXPECT_EQ(a.content_hash, b.content_hash);
    EXPECT_EQ(a.checksum, b.checksum);
}

TEST_F(FileManagerTest, RejectsDangerousNames) {
    const auto fm = open();
    EXPECT_THROW(put(*fm, "../etc/passwd.txt", "x"), ValidationError);
    EXPECT_THROW(put(*fm, "<script>.txt", "x"), ValidationError);
    EXPECT_THROW(put(*fm, " \n ", "x"), ValidationError);
    EXPECT_TRUE(fm->listFiles().empty());
}

TEST_F(FileManagerTest, SanitizesNames) {
    const auto fm = open();
    const auto rec = put(*fm, std::string("  report\x01.txt \n"), "x");
    EXPECT_EQ(rec.name, "report.txt");
}

TEST_F(FileManagerTest, EnforcesTypePolicy) {
    cfg.blocked_types = {"exe"};
    const auto fm = open();

    EXPECT_THROW(put(*fm, "setup.exe", "MZ"), ValidationError);
    EXPECT_THROW(put(*fm, "song.mp3", "ID3"), ValidationError);
    EXPECT_NO_THROW(put(*fm, "doc.pdf", "%PDF-1.4 broken"));
    EXPECT_EQ(fm->listFiles().size(), 1u);
}

TEST_F(FileManagerTest, RejectsScriptsInMetadata) {
    const auto fm = open();
    std::istringstream in("x");
    EXPECT_THROW(fm->uploadFile(in, "a.txt", {{"desc", "<script>alert(1)</script>"}}), ValidationError);
    EXPECT_TRUE(fm->listFiles().empty());

    const auto rec = put(*fm, "b.txt", "x");
    EXPECT_THROW(fm->updateMetadata(rec.id, {{"x", "javascript:alert(1)"}}), ValidationError);
}

TEST_F(FileManagerTest, DownloadReturnsStoredBytes) {
    const auto fm = open();
    const std::string body(5000, 'q');
    const auto rec = put(*fm, "q.txt", body);

    auto dl = fm->downloadFile(rec.id);
    EXPECT_EQ(slurp(*dl.stream), body);
    EXPECT_EQ(dl.record.id, rec.id);
    EXPECT_GE(dl.record.accessed_at, rec.accessed_at);

    EXPECT_THROW(fm->downloadFile("files_missing"), NotFound);
}

TEST_F(FileManagerTest, UnrenderableImageIsStillReady) {
    const auto fm = open();
    const auto rec = put(*fm, "broken.png", "definitely not a png");
    EXPECT_EQ(rec.status, Status::Ready);
    EXPECT_EQ(rec.type, Type::Image);
    EXPECT_FALSE(rec.thumbnail.has_value());
    EXPECT_FALSE(rec.preview.has_value());
    EXPECT_THROW(fm->getThumbnail(rec.id), NotFound);
}

TEST_F(FileManagerTest, InjectedGeneratorProducesThumbnails) {
    auto backend = std::make_shared<storage::LocalDiskBackend>();
    FileManager fm(cfg, {.backend = backend, .generator = std::make_shared<test::FakeGenerator>(backend, cfg)});

    const auto rec = put(fm, "cat.png", "pixels");
    ASSERT_TRUE(rec.thumbnail.has_value());
    EXPECT_EQ(rec.thumbnail->path, cfg.thumbnail_dir / (rec.id + ".jpg"));
    EXPECT_EQ(slurp(*fm.getThumbnail(rec.id)).size(), 4u);
    EXPECT_NO_THROW((void)fm.getPreview(rec.id));
}

TEST_F(FileManagerTest, DeleteRemovesEverything) {
    auto backend = std::make_shared<storage::LocalDiskBackend>();
    FileManager fm(cfg, {.backend = backend, .generator = std::make_shared<test::FakeGenerator>(backend, cfg)});

    const auto rec = put(fm, "cat.png", "v1");
    std::istringstream v2("v2");
    const auto updated = fm.addVersion(rec.id, v2, "second");
    ASSERT_EQ(updated.versions.size(), 1u);

    fm.deleteFile(rec.id);

    EXPECT_FALSE(fs::exists(updated.path));
    EXPECT_FALSE(fs::exists(updated.versions[0].path));
    EXPECT_FALSE(fs::exists(updated.thumbnail->path));
    EXPECT_FALSE(fs::exists(updated.preview->path));
    EXPECT_EQ(test::regularFilesIn(cfg.storage_dir), 0u);

    EXPECT_FALSE(fm.getFileInfo(rec.id).has_value());
    EXPECT_TRUE(fm.listFiles().empty());
    EXPECT_THROW(fm.downloadFile(rec.id), NotFound);
    EXPECT_THROW(fm.getThumbnail(rec.id), NotFound);
    EXPECT_THROW(fm.deleteFile(rec.id), NotFound);

    const auto tomb = fm.getTombstone(rec.id);
    ASSERT_TRUE(tomb.has_value());
    EXPECT_EQ(tomb->status, Status::Deleted);
    EXPECT_TRUE(tomb->deleted_at.has_value());
}

TEST_F(FileManagerTest, DeleteContinuesPastFailedRemovals) {
    auto backend = std::make_shared<test::FailingRemoveBackend>();
    FileManager fm(cfg, {.backend = backend, .generator = std::make_shared<test::FakeGenerator>(backend, cfg)});

    const auto rec = put(fm, "cat.png", "v1");
    std::istringstream v2("v2");
    const auto updated = fm.addVersion(rec.id, v2, "second");
    ASSERT_EQ(updated.versions.size(), 1u);
    ASSERT_TRUE(updated.thumbnail.has_value());

    backend->failOn = cfg.thumbnail_dir.string();
    EXPECT_NO_THROW(fm.deleteFile(rec.id));
    EXPECT_EQ(backend->failures.load(), 1);

    EXPECT_TRUE(fs::exists(updated.thumbnail->path));
    EXPECT_FALSE(fs::exists(updated.path));
    EXPECT_FALSE(fs::exists(updated.versions[0].path));
    EXPECT_FALSE(fs::exists(updated.preview->path));

    EXPECT_FALSE(fm.getFileInfo(rec.id).has_value());
    const auto tomb = fm.getTombstone(rec.id);
    ASSERT_TRUE(tomb.has_value());
    EXPECT_EQ(tomb->status, Status::Deleted);
    EXPECT_EQ(JsonRecordStore(cfg.storage_dir / "metadata").load(rec.id)->status, Status::Deleted);
}

TEST_F(FileManagerTest, DeletingFailedUploadIsAllowed) {
    cfg.max_file_size = 4;
    const auto fm = open();
    EXPECT_THROW(put(*fm, "big.txt", "too large"), SizeLimitExceeded);
    const auto failed = fm->listFiles();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_NO_THROW(fm->deleteFile(failed[0].id));
}

TEST_F(FileManagerTest, ListFiltersAndOrdering) {
    const auto fm = open();
    const auto a = put(*fm, "a.txt", "a", {.tags = {"work"}});
    std::this_thread::sleep_for(2ms);
    const auto b = put(*fm, "b.md", "b", {.tags = {"work", "notes"}});
    std::this_thread::sleep_for(2ms);
    const auto c = put(*fm, "c.pdf", "c");

    const auto all = fm->listFiles();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, c.id);
    EXPECT_EQ(all[1].id, b.id);
    EXPECT_EQ(all[2].id, a.id);

    EXPECT_EQ(fm->listFiles({.type = Type::Document}).size(), 1u);
    EXPECT_EQ(fm->listFiles({.type = Type::Text}).size(), 2u);
    EXPECT_EQ(fm->listFiles({.extension = "TXT"}).size(), 1u);
    EXPECT_EQ(fm->listFiles({.extension = ".md"}).size(), 1u);
    EXPECT_EQ(fm->listFiles({.tag = "work"}).size(), 2u);
    EXPECT_EQ(fm->listFiles({.tag = "notes"})[0].id, b.id);
    EXPECT_EQ(fm->listFiles({.status = Status::Ready}).size(), 3u);
    EXPECT_TRUE(fm->listFiles({.type = Type::Text, .tag = "missing"}).empty());
}

TEST_F(FileManagerTest, MutationsSurviveRestart) {
    std::string id;
    {
        const auto fm = open();
        id = put(*fm, "a.txt", "a", {.uploaded_by = "alice"}).id;

        const auto withMeta = fm->updateMetadata(id, {{"project", "apollo"}, {"rev", 3}});
        EXPECT_EQ(withMeta.metadata["project"], "apollo");
        fm->updateMetadata(id, {{"rev", 4}});

        const auto tagged = fm->addTags(id, {"alpha", " beta ", "", "alpha"});
        EXPECT_EQ(tagged.tags, (std::set<std::string>{"alpha", "beta"}));

        model::Permissions perms;
        perms.owner = "alice";
        perms.mode = "0600";
        perms.shared_with = {"bob"};
        fm->setPermissions(id, perms);
    }

    const auto fm = open();
    const auto rec = fm->getFileInfo(id);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, Status::Ready);
    EXPECT_EQ(rec->uploaded_by, "alice");
    EXPECT_EQ(rec->metadata["project"], "apollo");
    EXPECT_EQ(rec->metadata["rev"], 4);
    EXPECT_TRUE(rec->hasTag("beta"));
    ASSERT_TRUE(rec->permissions.has_value());
    EXPECT_EQ(rec->permissions->mode, "0600");
    EXPECT_EQ(rec->permissions->shared_with, std::vector<std::string>{"bob"});
    EXPECT_EQ(slurp(*fm->downloadFile(id).stream), "a");
}

TEST_F(FileManagerTest, MutationsOnUnknownIds) {
    const auto fm = open();
    EXPECT_THROW(fm->updateMetadata("files_nope", {{"a", 1}}), NotFound);
    EXPECT_THROW(fm->addTags("files_nope", {"a"}), NotFound);
    EXPECT_THROW(fm->setPermissions("files_nope", {}), NotFound);
}

TEST_F(FileManagerTest, RejectsInvalidPermissionMode) {
    const auto fm = open();
    const auto rec = put(*fm, "a.txt", "a");

    model::Permissions perms;
    for (const auto* bad : {"rwx", "0999", "12", "07777"}) {
        perms.mode = bad;
        EXPECT_THROW(fm->setPermissions(rec.id, perms), ValidationError) << bad;
    }
    perms.mode = "755";
    EXPECT_NO_THROW(fm->setPermissions(rec.id, perms));
}

TEST_F(FileManagerTest, AdmissionLimitHoldsExtraUploads) {
    cfg.concurrent_uploads = 2;
    const auto fm = open();

    std::vector<std::unique_ptr<test::BlockingSource>> sources;
    for (int i = 0; i < 3; ++i) sources.push_back(std::make_unique<test::BlockingSource>("payload " + std::to_string(i)));

    std::vector<std::future<model::Record>> uploads;
    for (int i = 0; i < 3; ++i) {
        uploads.push_back(std::async(std::launch::async, [&, i] {
            std::istream in(sources[i].get());
            return fm->uploadFile(in, "f" + std::to_string(i) + ".txt");
        }));
    }

    EXPECT_TRUE(waitFor([&] { return fm->getStats().active_uploads == 3; }));
    EXPECT_TRUE(waitFor([&] { return fm->slotsInUse() == 2; }));
    std::this_thread::sleep_for(100ms);

    int reading = 0;
    for (const auto& s : sources) reading += s->reading() ? 1 : 0;
    EXPECT_EQ(reading, 2);
    EXPECT_EQ(fm->slotsInUse(), 2u);

    for (const auto& s : sources) s->open();
    for (auto& u : uploads) EXPECT_EQ(u.get().status, Status::Ready);
    EXPECT_EQ(fm->slotsInUse(), 0u);
    EXPECT_EQ(fm->getStats().active_uploads, 0u);
}

TEST_F(FileManagerTest, CancelWhileWaitingConsumesNoSlot) {
    cfg.concurrent_uploads = 1;
    const auto fm = open();

    test::BlockingSource first("first");
    auto running = std::async(std::launch::async, [&] {
        std::istream in(&first);
        return fm->uploadFile(in, "first.txt");
    });
    EXPECT_TRUE(waitFor([&] { return first.reading(); }));

    UploadOptions opts;
    std::istringstream second("second");
    auto waiting = std::async(std::launch::async, [&] { return fm->uploadFile(second, "second.txt", {}, opts); });
    EXPECT_TRUE(waitFor([&] { return fm->getStats().active_uploads == 2; }));

    opts.cancel.cancel();
    EXPECT_THROW(waiting.get(), Cancelled);
    EXPECT_EQ(fm->slotsInUse(), 1u);

    first.open();
    EXPECT_EQ(running.get().status, Status::Ready);
    EXPECT_EQ(fm->slotsInUse(), 0u);
    EXPECT_EQ(fm->listFiles({.status = Status::Error}).size(), 1u);
}

TEST_F(FileManagerTest, CancelInFlightReleasesSlot) {
    cfg.max_file_size = 0;
    const auto fm = open();

    test::SlowSource src(256 * 1024, 2ms);
    std::istream in(&src);

    UploadOptions opts;
    opts.on_progress = [&](const std::string&, const model::UploadProgress& p) {
        if (p.bytes_transferred >= 4096) opts.cancel.cancel();
    };

    EXPECT_THROW(fm->uploadFile(in, "slow.txt", {}, opts), Cancelled);
    EXPECT_EQ(fm->slotsInUse(), 0u);
    EXPECT_EQ(test::regularFilesIn(cfg.storage_dir), 0u);

    const auto failed = fm->listFiles({.status = Status::Error});
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_FALSE(fm->getUploadProgress(failed[0].id).has_value());
}

TEST_F(FileManagerTest, DeadlineExpiresWhileQueued) {
    cfg.concurrent_uploads = 1;
    const auto fm = open();

    test::BlockingSource first("first");
    auto running = std::async(std::launch::async, [&] {
        std::istream in(&first);
        return fm->uploadFile(in, "first.txt");
    });
    EXPECT_TRUE(waitFor([&] { return first.reading(); }));

    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(put(*fm, "second.txt", "second", {.deadline = started + 150ms}), Cancelled);
    EXPECT_GE(std::chrono::steady_clock::now() - started, 150ms);

    first.open();
    EXPECT_EQ(running.get().status, Status::Ready);
}

TEST_F(FileManagerTest, LimitOfOneRunsUploadsInOrder) {
    cfg.concurrent_uploads = 1;
    cfg.max_file_size = 0;
    const auto fm = open();

    std::mutex m;
    std::string firstId;
    std::atomic firstStarted = false;
    std::atomic<int> overlapping = 0;

    auto first = std::async(std::launch::async, [&] {
        test::SlowSource src(16 * 1024, 3ms);
        std::istream in(&src);
        UploadOptions opts;
        opts.on_progress = [&](const std::string& id, const model::UploadProgress&) {
            if (!firstStarted) {
                std::scoped_lock lock(m);
                firstId = id;
                firstStarted = true;
            }
        };
        return fm->uploadFile(in, "first.txt", {}, opts);
    });
    EXPECT_TRUE(waitFor([&] { return firstStarted.load(); }));

    UploadOptions opts;
    opts.on_progress = [&](const std::string& id, const model::UploadProgress&) {
        std::string f;
        {
            std::scoped_lock lock(m);
            f = firstId;
        }
        const auto prior = fm->getFileInfo(f);
        if (!prior || prior->status != Status::Ready) ++overlapping;
        for (const auto& r : fm->listFiles({.status = Status::Uploading}))
            if (r.id != id) ++overlapping;
    };
    const auto second = put(*fm, "second.txt", std::string(4096, 's'), opts);

    EXPECT_EQ(first.get().status, Status::Ready);
    EXPECT_EQ(second.status, Status::Ready);
    EXPECT_EQ(overlapping.load(), 0);
}

TEST_F(FileManagerTest, ProgressIsReported) {
    const auto fm = open();
    const std::string body(10 * 1024, 'p');

    std::vector<model::UploadProgress> seen;
    std::vector<bool> visible;
    UploadOptions opts;
    opts.expected_size = body.size();
    opts.on_progress = [&](const std::string& id, const model::UploadProgress& p) {
        seen.push_back(p);
        visible.push_back(fm->getUploadProgress(id).has_value());
    };

    const auto rec = put(*fm, "p.txt", body, opts);
    ASSERT_EQ(seen.size(), 10u);
    for (size_t i = 1; i < seen.size(); ++i) EXPECT_GT(seen[i].bytes_transferred, seen[i - 1].bytes_transferred);
    ASSERT_TRUE(seen.back().percentage.has_value());
    EXPECT_DOUBLE_EQ(*seen.back().percentage, 100.0);
    for (const bool v : visible) EXPECT_TRUE(v);
    EXPECT_FALSE(fm->getUploadProgress(rec.id).has_value());
}

TEST_F(FileManagerTest, VersionsArePrunedToLimit) {
    cfg.max_versions = 2;
    const auto fm = open();

    const auto original = put(*fm, "doc.txt", "one", {.uploaded_by = "alice"});
    model::Record rec = original;
    for (const auto* body : {"two", "three", "four"}) {
        std::istringstream in(body);
        rec = fm->addVersion(rec.id, in, std::string("now ") + body, {.uploaded_by = "bob"});
    }

    ASSERT_EQ(rec.versions.size(), 2u);
    EXPECT_EQ(rec.versions[0].number, 2u);
    EXPECT_EQ(rec.versions[0].comment, "now two");
    EXPECT_EQ(rec.versions[0].checksum, crypto::hash::sha256("two"));
    EXPECT_EQ(rec.versions[1].number, 3u);
    EXPECT_EQ(rec.versions[1].comment, "now three");
    EXPECT_EQ(rec.versions[1].created_by, "bob");
    EXPECT_EQ(rec.version, 4u);
    EXPECT_EQ(rec.version_comment, "now four");
    EXPECT_EQ(rec.versions[1].checksum, crypto::hash::sha256("three"));
    EXPECT_EQ(rec.checksum, crypto::hash::sha256("four"));
    EXPECT_EQ(rec.uploaded_by, "bob");

    EXPECT_FALSE(fs::exists(original.path));
    for (const auto& v : rec.versions) EXPECT_TRUE(fs::exists(v.path));
    EXPECT_EQ(slurp(*fm->downloadFile(rec.id).stream), "four");
    EXPECT_EQ(slurp(*fm->getPreview(rec.id)), "four");
    EXPECT_EQ(fm->getFileInfo(rec.id)->versions.size(), 2u);
}

TEST_F(FileManagerTest, ZeroVersionLimitKeepsOnlyCurrentContent) {
    cfg.max_versions = 0;
    auto fm = open();

    const auto original = put(*fm, "doc.txt", "one");
    std::vector<fs::path> seen{original.path};
    model::Record rec = original;
    for (const auto* body : {"two", "three", "four"}) {
        std::istringstream in(body);
        rec = fm->addVersion(rec.id, in, body);
        EXPECT_TRUE(rec.versions.empty());
        ASSERT_TRUE(fs::exists(rec.path)) << body;
        EXPECT_EQ(slurp(*fm->downloadFile(rec.id).stream), body);
        seen.push_back(rec.path);
    }

    EXPECT_EQ(rec.version, 4u);
    EXPECT_EQ(std::set<fs::path>(seen.begin(), seen.end()).size(), seen.size());
    EXPECT_EQ(test::regularFilesIn(cfg.storage_dir), 1u);

    fm.reset();
    const auto reopened = open();
    const auto loaded = reopened->getFileInfo(rec.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->version, 4u);
    EXPECT_EQ(loaded->version_comment, "four");

    std::istringstream five("five");
    const auto next = reopened->addVersion(rec.id, five);
    EXPECT_EQ(next.version, 5u);
    EXPECT_EQ(slurp(*reopened->downloadFile(rec.id).stream), "five");
}

TEST_F(FileManagerTest, VersioningRules) {
    cfg.max_file_size = 4;
    const auto fm = open();

    std::istringstream in("new");
    EXPECT_THROW(fm->addVersion("files_nope", in), NotFound);

    EXPECT_THROW(put(*fm, "big.txt", "too big"), SizeLimitExceeded);
    const auto failed = fm->listFiles({.status = Status::Error});
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_THROW(fm->addVersion(failed[0].id, in), NotReady);

    const auto rec = put(*fm, "ok.txt", "ok");
    std::istringstream tooBig("way too big");
    EXPECT_THROW(fm->addVersion(rec.id, tooBig), SizeLimitExceeded);
    const auto after = fm->getFileInfo(rec.id);
    EXPECT_TRUE(after->versions.empty());
    EXPECT_EQ(after->status, Status::Ready);
    EXPECT_EQ(slurp(*fm->downloadFile(rec.id).stream), "ok");
}

TEST_F(FileManagerTest, VersioningDisabled) {
    cfg.versioning_enabled = false;
    const auto fm = open();
    const auto rec = put(*fm, "a.txt", "a");
    std::istringstream in("b");
    EXPECT_THROW(fm->addVersion(rec.id, in), ValidationError);
}

TEST_F(FileManagerTest, RestartMarksInterruptedUploadsFailed) {
    model::Record stale;
    stale.id = "files_interrupted";
    stale.name = stale.original_name = "half.txt";
    stale.path = cfg.storage_dir / "files_interrupted.txt";
    stale.type = Type::Text;
    stale.status = Status::Uploading;
    stale.created_at = stale.updated_at = std::chrono::system_clock::now();
    {
        JsonRecordStore store(cfg.storage_dir / "metadata");
        store.save(stale);
    }

    const auto fm = open();
    const auto rec = fm->getFileInfo(stale.id);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, Status::Error);
    EXPECT_EQ(JsonRecordStore(cfg.storage_dir / "metadata").load(stale.id)->status, Status::Error);
    EXPECT_THROW(fm->downloadFile(stale.id), NotReady);
}

TEST_F(FileManagerTest, InfectedUploadIsRejected) {
    cfg.virus_scan_enabled = true;
    const auto fm = open();

    try {
        put(*fm, "eicar.txt", std::string("X") + security::SignatureScanner::EICAR);
        FAIL() << "expected ThreatDetected";
    } catch (const ThreatDetected& e) {
        EXPECT_EQ(e.threats, std::vector<std::string>{"EICAR-Test-File"});
        EXPECT_STREQ(e.what(), "Threat detected: EICAR-Test-File");
    }

    EXPECT_EQ(fm->slotsInUse(), 0u);

    const auto failed = fm->listFiles({.status = Status::Error});
    ASSERT_EQ(failed.size(), 1u);
    ASSERT_TRUE(failed[0].virus_scan.has_value());
    EXPECT_FALSE(failed[0].virus_scan->clean);
    EXPECT_FALSE(failed[0].preview.has_value());
    EXPECT_EQ(test::regularFilesIn(cfg.storage_dir), 0u);
    EXPECT_EQ(test::regularFilesIn(cfg.preview_dir), 0u);

    const auto clean = put(*fm, "clean.txt", "nothing to see");
    ASSERT_TRUE(clean.virus_scan.has_value());
    EXPECT_TRUE(clean.virus_scan->clean);
    EXPECT_EQ(clean.virus_scan->scanner, "signature");
}

TEST_F(FileManagerTest, MutationSurfacesStoreFailure) {
    auto store = std::make_shared<test::GatedStore>(cfg.storage_dir / "metadata");
    FileManager fm(cfg, {.store = store});
    const auto rec = put(fm, "a.txt", "a");

    store->failSaves = true;
    EXPECT_THROW(fm.addTags(rec.id, {"lost"}), IOError);
    store->failSaves = false;

    const auto tagged = fm.addTags(rec.id, {"kept"});
    EXPECT_TRUE(tagged.hasTag("kept"));
    EXPECT_TRUE(JsonRecordStore(cfg.storage_dir / "metadata").load(rec.id)->hasTag("kept"));
}

TEST_F(FileManagerTest, SlowStoreDoesNotBlockReaders) {
    auto store = std::make_shared<test::GatedStore>(cfg.storage_dir / "metadata");
    FileManager fm(cfg, {.store = store});
    const auto rec = put(fm, "a.txt", "a");

    store->block();
    auto tagging = std::async(std::launch::async, [&] { return fm.addTags(rec.id, {"slow"}); });
    store->waitUntilBlocked();

    auto reading = std::async(std::launch::async, [&] { return fm.getFileInfo(rec.id); });
    const bool readerFinished = reading.wait_for(2s) == std::future_status::ready;
    store->unblock();

    EXPECT_TRUE(readerFinished);
    const auto seen = reading.get();
    ASSERT_TRUE(seen.has_value());
    EXPECT_TRUE(seen->hasTag("slow"));
    EXPECT_TRUE(tagging.get().hasTag("slow"));
}

TEST_F(FileManagerTest, StatsSummarizeRecords) {
    cfg.max_file_size = 6;
    const auto fm = open();
    put(*fm, "a.txt", "12345");
    put(*fm, "b.pdf", "123");
    EXPECT_THROW(put(*fm, "c.txt", "1234567"), SizeLimitExceeded);

    const auto s = fm->getStats();
    EXPECT_EQ(s.total_files, 3u);
    EXPECT_EQ(s.active_uploads, 0u);
    EXPECT_EQ(s.total_size, 8u);
    EXPECT_EQ(s.by_type.at(Type::Text), 2u);
    EXPECT_EQ(s.by_type.at(Type::Document), 1u);
    EXPECT_EQ(s.by_status.at(Status::Ready), 2u);
    EXPECT_EQ(s.by_status.at(Status::Error), 1u);

    const nlohmann::json j = s;
    EXPECT_EQ(j["by_type"]["text"], 2);
    EXPECT_EQ(j["by_status"]["error"], 1);
}
