#pragma once
#include <JuceHeader.h>

/**
 * The flat staging directory that holds every intermediate file of a run.
 *
 * Layout:
 *   export-<5-digit index>_<source index>.<ext>   slices as extracted
 *   render_<5-digit index>.<ext>                  slices kept by the weave
 *   render_part_<5-digit index>.<ext>             intermediate render chunks
 */
class Workspace
{
public:
    Workspace(const juce::File& rootDirectory, const juce::String& sliceExtension);
    ~Workspace();

    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * Deletes the staging directory if it exists and creates it again.
     * A failed delete is only logged; a failed create is returned as an error.
     */
    juce::Result reset();

    const juce::File& getRoot() const { return root; }
    const juce::String& getExtension() const { return extension; }

    juce::File getExportFile(int sequenceIndex, int sourceIndex) const;
    juce::File getRenderFile(int renderIndex) const;
    juce::File getRenderPartFile(int partIndex) const;

    /**
     * Reads the indexes back out of an export file name.
     * @return false if the name is not an extracted slice with our extension
     */
    bool parseExportFileName(const juce::String& fileName, int& sequenceIndex, int& sourceIndex) const;

    /** True if the name looks like an extracted slice with our extension. */
    bool isExportFileName(const juce::String& fileName) const;

    /**
     * Lists the extracted slices currently in the workspace, ordered by
     * sequence index, then source index. Files that do not match the export
     * naming are ignored.
     */
    std::vector<juce::File> listExportedSlices() const;

private:
    juce::File root;
    juce::String extension;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(Workspace)
};
