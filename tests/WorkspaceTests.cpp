#include <gtest/gtest.h>

#include "TestHelpers.h"
#include "rendering/Workspace.h"

TEST(WorkspaceTest, ResetCreatesMissingDirectory)
{
    TestDirectory directory;
    Workspace workspace(directory.getChildFile("nested").getChildFile("work"), "wav");

    ASSERT_TRUE(workspace.reset().wasOk());
    EXPECT_TRUE(workspace.getRoot().isDirectory());
}

TEST(WorkspaceTest, ResetWipesPreviousRun)
{
    TestDirectory directory;
    Workspace workspace(directory.getChildFile("work"), "wav");
    ASSERT_TRUE(workspace.reset().wasOk());

    ASSERT_TRUE(workspace.getExportFile(0, 0).replaceWithText("stale"));
    ASSERT_TRUE(workspace.getRoot().getChildFile("sub").createDirectory().wasOk());

    ASSERT_TRUE(workspace.reset().wasOk());

    EXPECT_TRUE(workspace.getRoot().isDirectory());
    EXPECT_EQ(workspace.getRoot().getNumberOfChildFiles(juce::File::findFilesAndDirectories), 0);
}

TEST(WorkspaceTest, ResetFailsWhenDirectoryCannotBeCreated)
{
    TestDirectory directory;
    const juce::File blocker = directory.getChildFile("blocker");
    ASSERT_TRUE(blocker.replaceWithText("not a directory"));

    Workspace workspace(blocker.getChildFile("work"), "wav");
    EXPECT_TRUE(workspace.reset().failed());
}

TEST(WorkspaceTest, FileNamesFollowTheStagingLayout)
{
    Workspace workspace(juce::File("/tmp/sliceweave"), ".wav");

    EXPECT_EQ(workspace.getExtension(), "wav");
    EXPECT_EQ(workspace.getExportFile(3, 1).getFileName(), "export-00003_1.wav");
    EXPECT_EQ(workspace.getRenderFile(12).getFileName(), "render_00012.wav");
    EXPECT_EQ(workspace.getRenderPartFile(2).getFileName(), "render_part_00002.wav");
    EXPECT_EQ(workspace.getRenderFile(0).getParentDirectory(), workspace.getRoot());
}

TEST(WorkspaceTest, RecognisesOnlyExportNames)
{
    Workspace workspace(juce::File("/tmp/sliceweave"), "wav");

    EXPECT_TRUE(workspace.isExportFileName("export-00000_0.wav"));
    EXPECT_TRUE(workspace.isExportFileName("export-01234_12.wav"));

    EXPECT_FALSE(workspace.isExportFileName("export-00000_0.mp3"));
    EXPECT_FALSE(workspace.isExportFileName("export-00000.wav"));
    EXPECT_FALSE(workspace.isExportFileName("export-abc_0.wav"));
    EXPECT_FALSE(workspace.isExportFileName("export-00000_.wav"));
    EXPECT_FALSE(workspace.isExportFileName("render_00000.wav"));
    EXPECT_FALSE(workspace.isExportFileName("notes.txt"));
}

TEST(WorkspaceTest, ListingIsFilteredAndSortedByIndex)
{
    TestDirectory directory;
    Workspace workspace(directory.getChildFile("work"), "wav");
    ASSERT_TRUE(workspace.reset().wasOk());

    for (const auto* name : { "export-00001_0.wav", "export-00000_1.wav", "export-00000_0.wav",
                              "render_00000.wav", "export-00002_0.txt", "notes.txt", "export-abc_0.wav" })
        ASSERT_TRUE(workspace.getRoot().getChildFile(name).replaceWithText("x"));

    const auto slices = workspace.listExportedSlices();

    ASSERT_EQ(slices.size(), 3u);
    EXPECT_EQ(slices[0].getFileName(), "export-00000_0.wav");
    EXPECT_EQ(slices[1].getFileName(), "export-00000_1.wav");
    EXPECT_EQ(slices[2].getFileName(), "export-00001_0.wav");
}

TEST(WorkspaceTest, ListingKeepsOrderPastFiveDigitIndexes)
{
    TestDirectory directory;
    Workspace workspace(directory.getChildFile("work"), "wav");
    ASSERT_TRUE(workspace.reset().wasOk());

    for (int sequenceIndex : { 100001, 9999, 100000, 99999, 10000 })
        for (int sourceIndex : { 1, 0 })
            ASSERT_TRUE(workspace.getExportFile(sequenceIndex, sourceIndex).replaceWithText("x"));

    const auto slices = workspace.listExportedSlices();
    ASSERT_EQ(slices.size(), 10u);

    const juce::StringArray expected { "export-09999_0.wav", "export-09999_1.wav",
                                       "export-10000_0.wav", "export-10000_1.wav",
                                       "export-99999_0.wav", "export-99999_1.wav",
                                       "export-100000_0.wav", "export-100000_1.wav",
                                       "export-100001_0.wav", "export-100001_1.wav" };

    for (size_t i = 0; i < slices.size(); ++i)
        EXPECT_EQ(slices[i].getFileName(), expected[static_cast<int>(i)]) << "at position " << i;
}

TEST(WorkspaceTest, ListingOrdersSourceIndexesNumerically)
{
    TestDirectory directory;
    Workspace workspace(directory.getChildFile("work"), "wav");
    ASSERT_TRUE(workspace.reset().wasOk());

    for (int sourceIndex : { 10, 2, 1 })
        ASSERT_TRUE(workspace.getExportFile(0, sourceIndex).replaceWithText("x"));

    const auto slices = workspace.listExportedSlices();
    ASSERT_EQ(slices.size(), 3u);
    EXPECT_EQ(slices[0].getFileName(), "export-00000_1.wav");
    EXPECT_EQ(slices[1].getFileName(), "export-00000_2.wav");
    EXPECT_EQ(slices[2].getFileName(), "export-00000_10.wav");
}

TEST(WorkspaceTest, ParsesIndexesFromExportNames)
{
    Workspace workspace(juce::File("/tmp/sliceweave"), "wav");

    int sequenceIndex = -1, sourceIndex = -1;
    ASSERT_TRUE(workspace.parseExportFileName("export-100000_12.wav", sequenceIndex, sourceIndex));
    EXPECT_EQ(sequenceIndex, 100000);
    EXPECT_EQ(sourceIndex, 12);

    EXPECT_FALSE(workspace.parseExportFileName("export-1234567890_0.wav", sequenceIndex, sourceIndex));
}

TEST(WorkspaceTest, ListingOfMissingDirectoryIsEmpty)
{
    TestDirectory directory;
    Workspace workspace(directory.getChildFile("never-created"), "wav");

    EXPECT_TRUE(workspace.listExportedSlices().empty());
}
