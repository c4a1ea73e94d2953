#include "../stream/FileSelector.hpp"
#include "../engine/Errors.hpp"
#include "FakeTransferEngine.hpp"
#include <gtest/gtest.h>

TEST(FileSelectorTest, PicksLargestVideo) {
    TransferMetadata metadata = makeMetadata(
        {{"Sample/readme.txt", 5000}, {"Sample/trailer.mkv", 1000}, {"Sample/movie.mp4", 3000}}, 1024);

    FileEntry file = FileSelector::select(metadata.files);
    EXPECT_EQ("Sample/movie.mp4", file.path);
    EXPECT_EQ(2, file.index);
    EXPECT_EQ(6000, file.offset);
}

TEST(FileSelectorTest, FallsBackToLargestFile) {
    TransferMetadata metadata = makeMetadata({{"notes.txt", 10}, {"payload.bin", 20}, {"cover.jpg", 15}}, 16);

    EXPECT_EQ("payload.bin", FileSelector::select(metadata.files).path);
}

TEST(FileSelectorTest, FirstFileWinsTies) {
    TransferMetadata metadata = makeMetadata({{"a.mp4", 700}, {"b.mkv", 700}}, 256);

    EXPECT_EQ("a.mp4", FileSelector::select(metadata.files).path);
}

TEST(FileSelectorTest, EmptyListHasNoPlayableFile) {
    try {
        FileSelector::select({});
        FAIL() << "Expected NoPlayableFileError";
    } catch (const NoPlayableFileError& e) {
        EXPECT_STREQ("no video file found in torrent", e.what());
    }
}

TEST(FileSelectorTest, ExtensionsAreCaseInsensitive) {
    EXPECT_TRUE(FileSelector::isVideo("MOVIE.MKV"));
    EXPECT_TRUE(FileSelector::isVideo("show/episode.Ts"));
    EXPECT_TRUE(FileSelector::isVideo("clip.m4v"));
    EXPECT_FALSE(FileSelector::isVideo("subtitles.srt"));
    EXPECT_FALSE(FileSelector::isVideo("mp4"));
}

TEST(FileSelectorTest, ExtensionIgnoresDirectoryDots) {
    EXPECT_EQ("", FileSelector::extensionOf("release.v1/video"));
    EXPECT_EQ(".avi", FileSelector::extensionOf("release.v1/video.AVI"));
}
