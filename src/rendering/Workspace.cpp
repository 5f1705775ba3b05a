#include "Workspace.h"

#include <algorithm>

namespace
{
    const juce::String exportPrefix = "export-";

    juce::String padIndex(int index)
    {
        return juce::String::formatted("%05d", index);
    }
}

Workspace::Workspace(const juce::File& rootDirectory, const juce::String& sliceExtension)
    : root(rootDirectory),
      extension(sliceExtension.trimCharactersAtStart("."))
{
}

Workspace::~Workspace()
{
}

void Workspace::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

juce::Result Workspace::reset()
{
    if (root.exists())
    {
        if (!root.deleteRecursively())
        {
            if (logCallback)
                logCallback("WARNING: Failed to delete workspace " + root.getFullPathName());
        }
    }

    // createDirectory() succeeds when the directory is already there
    const juce::Result result = root.createDirectory();

    if (result.failed())
    {
        if (logCallback)
            logCallback("ERROR: Failed to create workspace " + root.getFullPathName() + ": " + result.getErrorMessage());
        return result;
    }

    if (logCallback)
        logCallback("Workspace ready: " + root.getFullPathName());

    return juce::Result::ok();
}

juce::File Workspace::getExportFile(int sequenceIndex, int sourceIndex) const
{
    return root.getChildFile(exportPrefix + padIndex(sequenceIndex) + "_" + juce::String(sourceIndex) + "." + extension);
}

juce::File Workspace::getRenderFile(int renderIndex) const
{
    return root.getChildFile("render_" + padIndex(renderIndex) + "." + extension);
}

juce::File Workspace::getRenderPartFile(int partIndex) const
{
    return root.getChildFile("render_part_" + padIndex(partIndex) + "." + extension);
}

bool Workspace::parseExportFileName(const juce::String& fileName, int& sequenceIndex, int& sourceIndex) const
{
    if (!fileName.startsWith(exportPrefix) || !fileName.endsWith("." + extension))
        return false;

    const juce::String stem = fileName.substring(exportPrefix.length(),
                                                 fileName.length() - extension.length() - 1);
    const int separator = stem.indexOfChar('_');

    if (separator <= 0 || separator == stem.length() - 1)
        return false;

    const juce::String sequencePart = stem.substring(0, separator);
    const juce::String sourcePart = stem.substring(separator + 1);

    // Nine digits keeps both parts inside an int
    if (!sequencePart.containsOnly("0123456789") || !sourcePart.containsOnly("0123456789")
        || sequencePart.length() > 9 || sourcePart.length() > 9)
        return false;

    sequenceIndex = sequencePart.getIntValue();
    sourceIndex = sourcePart.getIntValue();
    return true;
}

bool Workspace::isExportFileName(const juce::String& fileName) const
{
    int sequenceIndex = 0, sourceIndex = 0;
    return parseExportFileName(fileName, sequenceIndex, sourceIndex);
}

std::vector<juce::File> Workspace::listExportedSlices() const
{
    struct ListedSlice
    {
        int sequenceIndex;
        int sourceIndex;
        juce::File file;
    };

    std::vector<juce::File> slices;

    if (!root.isDirectory())
        return slices;

    std::vector<ListedSlice> listed;
    for (const auto& entry : juce::RangedDirectoryIterator(root, false, "*", juce::File::findFiles))
    {
        ListedSlice slice { 0, 0, entry.getFile() };
        if (parseExportFileName(slice.file.getFileName(), slice.sequenceIndex, slice.sourceIndex))
            listed.push_back(slice);
    }

    // Numeric order, so indexes wider than the zero padding still sort after narrower ones
    std::sort(listed.begin(), listed.end(), [](const ListedSlice& a, const ListedSlice& b)
    {
        if (a.sequenceIndex != b.sequenceIndex)
            return a.sequenceIndex < b.sequenceIndex;

        return a.sourceIndex < b.sourceIndex;
    });

    slices.reserve(listed.size());
    for (const auto& slice : listed)
        slices.push_back(slice.file);

    return slices;
}
