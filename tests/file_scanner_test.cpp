#include <gtest/gtest.h>
#include "core/file_scanner.hpp"
#include "core/file_utils.hpp"
#include "core/json_text.hpp"
#include "core/scan_error.hpp"
#include "core/sidecar_writer.hpp"
#include "test_base.hpp"
#include <limits>
#include <map>
#include <mutex>
#include <sys/stat.h>
#include <vector>

namespace
{
    // Records every event and checks per-file ordering as events arrive
    class RecordingObserver : public ProgressObserver
    {
    public:
        void onProgress(const ProgressEvent &event) override
        {
            events.push_back(event);
            if (const auto *started = std::get_if<FileStarted>(&event))
            {
                EXPECT_EQ(state[started->path], 0) << "started twice: " << started->path;
                state[started->path] = 1;
            }
            else
            {
                const auto &completed = std::get<FileCompleted>(event);
                EXPECT_EQ(state[completed.path], 1) << "completed before start: " << completed.path;
                state[completed.path] = 2;
            }
        }

        size_t count(bool started) const
        {
            size_t n = 0;
            for (const auto &event : events)
            {
                if (std::holds_alternative<FileStarted>(event) == started)
                    ++n;
            }
            return n;
        }

        std::vector<ProgressEvent> events;
        std::map<std::string, int> state;
    };

    void expectConsistent(const ScanResult &result)
    {
        EXPECT_TRUE(result.isConsistent());
        EXPECT_EQ(result.total_files, result.successful + result.failed + result.skipped);
        EXPECT_EQ(result.total_files, result.scanned_files.size());
    }
}

class FileScannerTest : public TestBase
{
protected:
    ScanOptions optionsFor(const std::string &path)
    {
        ScanOptions options;
        options.path = path;
        options.max_threads = 4;
        return options;
    }

    ErrorKind scanExpectingError(const ScanOptions &options)
    {
        FileScanner scanner;
        try
        {
            scanner.scanPath(options);
        }
        catch (const ScanError &e)
        {
            return e.kind();
        }
        ADD_FAILURE() << "Expected ScanError for " << options.path;
        return ErrorKind::Internal;
    }
};

TEST_F(FileScannerTest, ScanSingleFileWritesSidecar)
{
    auto image = createFile("test.jpg", "fake image data");
    FileScanner scanner;
    ScanResult result = scanner.scanPath(optionsFor(image));

    EXPECT_EQ(result.total_files, 1u);
    EXPECT_EQ(result.successful, 1u);
    expectConsistent(result);

    const ScannedFile &scanned = result.scanned_files.at(0);
    EXPECT_EQ(scanned.action, ScanAction::Written);
    EXPECT_EQ(scanned.sidecar_path, SidecarWriter::sidecarPathFor(image));
    EXPECT_EQ(scanned.hash, FileUtils::computeHash("fake image data"));
    EXPECT_EQ(scanned.size_bytes, 15u);
    EXPECT_FALSE(scanned.error.has_value());

    Sidecar stored = SidecarWriter::read(SidecarWriter::sidecarPathFor(image));
    EXPECT_EQ(stored.source.file_hash, *scanned.hash);
    EXPECT_EQ(stored.source.file_size_bytes, 15u);
    EXPECT_EQ(stored.source.file_path, image);
    EXPECT_EQ(stored.pipeline_signature.hash_algorithm, "sha256");
}

TEST_F(FileScannerTest, FreshSidecarHasEqualTimestamps)
{
    auto image = createFile("test.jpg");
    Sidecar sidecar = FileScanner::scanFile(image, false);
    EXPECT_EQ(sidecar.created_at, sidecar.updated_at);
    EXPECT_EQ(sidecar.pipeline_signature.created_at, sidecar.created_at);
    EXPECT_FALSE(sidecar.image.has_value());
    EXPECT_TRUE(sidecar.faces.empty());
    EXPECT_TRUE(sidecar.tags.empty());
    EXPECT_TRUE(sidecar.thumbnails.empty());
}

TEST_F(FileScannerTest, ScanFileValidatesItsPath)
{
    try
    {
        FileScanner::scanFile(testDir() + "/missing.jpg", true);
        FAIL() << "Expected ScanError";
    }
    catch (const ScanError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }

    try
    {
        FileScanner::scanFile(testDir(), true);
        FAIL() << "Expected ScanError";
    }
    catch (const ScanError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
    }
}

TEST_F(FileScannerTest, DryRunNeverTouchesTheFilesystem)
{
    createFile("a.jpg", "alpha");
    createFile("sub/b.png", "beta");
    createFile("sub/c.txt", "gamma");
    const auto before = listTree();

    ScanOptions options = optionsFor(testDir());
    options.recursive = true;
    options.dry_run = true;

    FileScanner scanner;
    ScanResult first = scanner.scanPath(options);
    EXPECT_EQ(listTree(), before);

    ScanResult second = scanner.scanPath(options);
    EXPECT_EQ(listTree(), before);

    expectConsistent(first);
    EXPECT_EQ(first.successful, 0u);
    EXPECT_EQ(first.skipped, 3u);
    ASSERT_EQ(first.scanned_files.size(), second.scanned_files.size());
    for (size_t i = 0; i < first.scanned_files.size(); ++i)
    {
        EXPECT_EQ(first.scanned_files[i].path, second.scanned_files[i].path);
        EXPECT_EQ(first.scanned_files[i].hash, second.scanned_files[i].hash);
        EXPECT_FALSE(first.scanned_files[i].sidecar_path.has_value());
    }
}

TEST_F(FileScannerTest, DryRunSingleFileIsReportedAsSkippedWithHash)
{
    auto image = createFile("test.jpg");
    ScanOptions options = optionsFor(image);
    options.dry_run = true;

    FileScanner scanner;
    ScanResult result = scanner.scanPath(options);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(result.scanned_files[0].action, ScanAction::Skipped);
    EXPECT_TRUE(result.scanned_files[0].hash.has_value());
    EXPECT_TRUE(result.scanned_files[0].size_bytes.has_value());
    EXPECT_FALSE(exists(SidecarWriter::sidecarPathFor(image)));
}

TEST_F(FileScannerTest, RescanRotatesBackups)
{
    auto image = createFile("test.jpg");
    const std::string sidecar = SidecarWriter::sidecarPathFor(image);
    FileScanner scanner;

    scanner.scanPath(optionsFor(image));
    const std::string first = readFile(sidecar);

    scanner.scanPath(optionsFor(image));
    const std::string second = readFile(sidecar);
    EXPECT_EQ(readFile(SidecarWriter::backupPathFor(image, 1)), first);

    scanner.scanPath(optionsFor(image));
    EXPECT_EQ(readFile(SidecarWriter::backupPathFor(image, 1)), second);
    EXPECT_EQ(readFile(SidecarWriter::backupPathFor(image, 2)), first);
    EXPECT_FALSE(exists(SidecarWriter::backupPathFor(image, 3)));
}

TEST_F(FileScannerTest, IncludePatternSelectsJpegs)
{
    createFile("photo.jpg");
    createFile("photo.png");

    ScanOptions options = optionsFor(testDir());
    options.include = std::vector<std::string>{"*.jpg"};

    FileScanner scanner;
    ScanResult result = scanner.scanPath(options);
    EXPECT_EQ(result.total_files, 2u);
    EXPECT_EQ(result.successful, 1u);
    EXPECT_EQ(result.skipped, 1u);
    expectConsistent(result);

    for (const auto &file : result.scanned_files)
    {
        if (file.action == ScanAction::Skipped)
        {
            EXPECT_NE(file.path.find("photo.png"), std::string::npos);
            EXPECT_FALSE(file.hash.has_value());
            EXPECT_FALSE(file.size_bytes.has_value());
        }
    }
}

TEST_F(FileScannerTest, ExcludePatternSkipsToolDirectory)
{
    createFile("root.jpg");
    createFile(".jozin/inner.jpg");

    ScanOptions options = optionsFor(testDir());
    options.recursive = true;
    options.exclude = std::vector<std::string>{"**/.jozin/**"};

    FileScanner scanner;
    ScanResult result = scanner.scanPath(options);
    EXPECT_EQ(result.total_files, 2u);
    EXPECT_EQ(result.successful, 1u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_FALSE(exists(testDir() + "/.jozin/inner.jpg.json"));
    EXPECT_TRUE(exists(testDir() + "/root.jpg.json"));
}

TEST_F(FileScannerTest, NonexistentRootIsIoError)
{
    EXPECT_EQ(scanExpectingError(optionsFor(testDir() + "/nope")), ErrorKind::Io);
}

TEST_F(FileScannerTest, UnsupportedSingleFileIsValidationError)
{
    auto doc = createFile("notes.txt");
    EXPECT_EQ(scanExpectingError(optionsFor(doc)), ErrorKind::Validation);
    EXPECT_FALSE(exists(doc + ".json"));
}

TEST_F(FileScannerTest, SpecialFileIsValidationError)
{
    const std::string fifo = testDir() + "/pipe.jpg";
    ASSERT_EQ(::mkfifo(fifo.c_str(), 0644), 0);
    EXPECT_EQ(scanExpectingError(optionsFor(fifo)), ErrorKind::Validation);
}

TEST_F(FileScannerTest, InvalidOptionsFailBeforeAnyWrite)
{
    createFile("a.jpg");

    ScanOptions bad_pattern = optionsFor(testDir());
    bad_pattern.include = std::vector<std::string>{"[unterminated"};
    EXPECT_EQ(scanExpectingError(bad_pattern), ErrorKind::Validation);

    ScanOptions bad_exclude = optionsFor(testDir());
    bad_exclude.exclude = std::vector<std::string>{"trailing\\"};
    EXPECT_EQ(scanExpectingError(bad_exclude), ErrorKind::Validation);

    ScanOptions no_threads = optionsFor(testDir());
    no_threads.max_threads = 0;
    EXPECT_EQ(scanExpectingError(no_threads), ErrorKind::User);

    ScanOptions pixel = optionsFor(testDir());
    pixel.hash_mode = "pixel";
    EXPECT_EQ(scanExpectingError(pixel), ErrorKind::User);

    EXPECT_FALSE(exists(testDir() + "/a.jpg.json"));
}

TEST_F(FileScannerTest, ProgressEventsBracketEachCandidate)
{
    for (int i = 0; i < 12; ++i)
    {
        createFile("img_" + std::to_string(i) + ".jpg", "content " + std::to_string(i));
    }
    createFile("readme.txt");

    RecordingObserver observer;
    FileScanner scanner(&observer);
    ScanOptions options = optionsFor(testDir());
    options.max_threads = 3;
    ScanResult result = scanner.scanPath(options);

    EXPECT_EQ(result.successful, 12u);
    EXPECT_EQ(result.skipped, 1u);
    expectConsistent(result);

    // Filtered files produce no events
    EXPECT_EQ(observer.count(true), 12u);
    EXPECT_EQ(observer.count(false), 12u);
    for (const auto &entry : observer.state)
    {
        EXPECT_EQ(entry.second, 2) << entry.first;
    }
    for (const auto &event : observer.events)
    {
        if (const auto *completed = std::get_if<FileCompleted>(&event))
        {
            EXPECT_TRUE(completed->success);
            EXPECT_TRUE(completed->size_bytes.has_value());
            EXPECT_FALSE(completed->error.has_value());
        }
    }
}

TEST_F(FileScannerTest, PerFileFailureDoesNotAbortTheWalk)
{
    createFile("good.jpg");
    auto blocked = createFile("bad.jpg");
    // A directory where the temporary sidecar goes makes open() fail with EISDIR
    std::filesystem::create_directory(SidecarWriter::tempPathFor(blocked));

    RecordingObserver observer;
    FileScanner scanner(&observer);
    ScanResult result = scanner.scanPath(optionsFor(testDir()));

    EXPECT_EQ(result.total_files, 2u);
    EXPECT_EQ(result.successful, 1u);
    EXPECT_EQ(result.failed, 1u);
    expectConsistent(result);

    bool saw_failure = false;
    for (const auto &file : result.scanned_files)
    {
        if (file.action == ScanAction::Failed)
        {
            saw_failure = true;
            EXPECT_EQ(file.path, blocked);
            ASSERT_TRUE(file.error.has_value());
            EXPECT_NE(file.error->find("I/O error"), std::string::npos);
            EXPECT_FALSE(file.sidecar_path.has_value());
        }
    }
    EXPECT_TRUE(saw_failure);
    EXPECT_FALSE(exists(SidecarWriter::sidecarPathFor(blocked)));
    EXPECT_TRUE(exists(testDir() + "/good.jpg.json"));

    size_t failed_events = 0;
    for (const auto &event : observer.events)
    {
        if (const auto *completed = std::get_if<FileCompleted>(&event))
        {
            if (!completed->success)
            {
                ++failed_events;
                EXPECT_EQ(completed->path, blocked);
                EXPECT_TRUE(completed->error.has_value());
            }
        }
    }
    EXPECT_EQ(failed_events, 1u);
}

TEST_F(FileScannerTest, UnreadableFileIsRecordedAsFailed)
{
    if (::geteuid() == 0)
    {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    createFile("good.jpg");
    auto unreadable = createFile("bad.jpg");
    ASSERT_EQ(::chmod(unreadable.c_str(), 0000), 0);

    FileScanner scanner;
    ScanResult result = scanner.scanPath(optionsFor(testDir()));
    ::chmod(unreadable.c_str(), 0644);

    EXPECT_EQ(result.successful, 1u);
    EXPECT_EQ(result.failed, 1u);
    EXPECT_FALSE(exists(unreadable + ".json"));
}

TEST_F(FileScannerTest, NonUtf8FileNameIsWrittenAndReported)
{
    const std::string replacement = "\xEF\xBF\xBD"; // U+FFFD
    auto odd = createFile("bad\xff.jpg", "odd name");
    createFile("note\xfe.txt");

    FileScanner scanner;
    ScanResult result = scanner.scanPath(optionsFor(testDir()));
    EXPECT_EQ(result.successful, 1u);
    EXPECT_EQ(result.failed, 0u);
    EXPECT_EQ(result.skipped, 1u);
    expectConsistent(result);

    // The sidecar sits beside the original under the exact byte name
    ASSERT_TRUE(exists(SidecarWriter::sidecarPathFor(odd)));
    Sidecar stored = SidecarWriter::read(SidecarWriter::sidecarPathFor(odd));
    EXPECT_NE(stored.source.file_path.find(replacement), std::string::npos);
    EXPECT_EQ(stored.source.file_hash, FileUtils::computeHash("odd name"));

    std::string text;
    ASSERT_NO_THROW(text = toJsonText(nlohmann::ordered_json(result)));
    EXPECT_NE(text.find(replacement), std::string::npos);

    try
    {
        scanner.scanPath(optionsFor(testDir() + "/missing\xff"));
        FAIL() << "Expected ScanError";
    }
    catch (const ScanError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
        ASSERT_NO_THROW(text = toJsonText(e.toJson()));
        EXPECT_NE(text.find(replacement), std::string::npos);
    }
}

TEST_F(FileScannerTest, OversizedThreadCountIsClamped)
{
    for (int i = 0; i < 5; ++i)
    {
        createFile("f" + std::to_string(i) + ".jpg", std::to_string(i));
    }

    FileScanner scanner;
    for (size_t threads : {std::numeric_limits<size_t>::max(), (size_t{1} << 32) + 1,
                           static_cast<size_t>(std::numeric_limits<int>::max()) + 1})
    {
        ScanOptions options = optionsFor(testDir());
        options.max_threads = threads;
        options.dry_run = true;
        ScanResult result = scanner.scanPath(options);
        EXPECT_EQ(result.skipped, 5u) << threads;
        EXPECT_EQ(result.failed, 0u) << threads;
    }
}

TEST_F(FileScannerTest, ResultOrderIsDeterministicAcrossThreadCounts)
{
    for (int i = 0; i < 20; ++i)
    {
        createFile("d" + std::to_string(i % 3) + "/f" + std::to_string(i) + ".png", std::to_string(i));
    }

    ScanOptions options = optionsFor(testDir());
    options.recursive = true;
    options.dry_run = true;

    FileScanner scanner;
    options.max_threads = 1;
    ScanResult serial = scanner.scanPath(options);
    options.max_threads = 8;
    ScanResult parallel = scanner.scanPath(options);

    ASSERT_EQ(serial.scanned_files.size(), 20u);
    ASSERT_EQ(parallel.scanned_files.size(), 20u);
    for (size_t i = 0; i < serial.scanned_files.size(); ++i)
    {
        EXPECT_EQ(serial.scanned_files[i].path, parallel.scanned_files[i].path);
        EXPECT_EQ(serial.scanned_files[i].hash, parallel.scanned_files[i].hash);
    }
}

TEST(ScanResultTest, JsonShape)
{
    ScanResult result;
    result.record(ScannedFile::written("/p/a.jpg", "/p/a.jpg.json", "ff", 3));
    result.record(ScannedFile::filtered("/p/b.txt", "Not an image file (unsupported extension)"));
    result.record(ScannedFile::failed("/p/c.jpg", "I/O error: denied"));

    nlohmann::ordered_json json = result;
    EXPECT_EQ(json["total_files"], 3);
    EXPECT_EQ(json["successful"], 1);
    EXPECT_EQ(json["skipped"], 1);
    EXPECT_EQ(json["failed"], 1);
    EXPECT_EQ(json["scanned_files"][0]["action"], "written");
    EXPECT_EQ(json["scanned_files"][0]["sidecar_path"], "/p/a.jpg.json");
    EXPECT_FALSE(json["scanned_files"][1].contains("hash"));
    EXPECT_EQ(json["scanned_files"][2]["action"], "failed");
    EXPECT_FALSE(json["scanned_files"][2].contains("size_bytes"));
}

TEST(ScanErrorTest, KindsMapToExitCodes)
{
    EXPECT_EQ(ScanError::user("x").exitCode(), 1);
    EXPECT_EQ(ScanError::io("x").exitCode(), 2);
    EXPECT_EQ(ScanError::validation("x").exitCode(), 3);
    EXPECT_EQ(ScanError::internal("x").exitCode(), 4);

    ScanError error = ScanError::io("Path not found: /x");
    EXPECT_STREQ(error.what(), "I/O error: Path not found: /x");
    EXPECT_EQ(error.toJson()["kind"], "io");
    EXPECT_EQ(error.toJson()["message"], "Path not found: /x");
}
