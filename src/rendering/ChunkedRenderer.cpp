#include "ChunkedRenderer.h"

ChunkedRenderer::ChunkedRenderer(AudioToolkit& toolkit, const Workspace& workspace, int partSize)
    : toolkit(toolkit),
      workspace(workspace),
      partSize(juce::jmax(1, partSize))
{
}

ChunkedRenderer::~ChunkedRenderer()
{
}

void ChunkedRenderer::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

std::vector<WeaveTypes::SequencePlan> ChunkedRenderer::partition(const WeaveTypes::SequencePlan& plan, int partSize)
{
    std::vector<WeaveTypes::SequencePlan> chunks;
    const size_t chunkSize = static_cast<size_t>(juce::jmax(1, partSize));

    for (size_t start = 0; start < plan.size(); start += chunkSize)
    {
        const size_t end = juce::jmin(plan.size(), start + chunkSize);
        chunks.emplace_back(plan.begin() + static_cast<std::ptrdiff_t>(start),
                            plan.begin() + static_cast<std::ptrdiff_t>(end));
    }

    return chunks;
}

bool ChunkedRenderer::render(const WeaveTypes::SequencePlan& plan, const juce::File& outputFile)
{
    renderParts.clear();

    if (plan.empty())
    {
        if (logCallback)
            logCallback("ERROR: Nothing to render");
        return false;
    }

    if (!outputFile.getParentDirectory().isDirectory())
    {
        if (logCallback)
            logCallback("ERROR: Output directory doesn't exist: " + outputFile.getParentDirectory().getFullPathName());
        return false;
    }

    if (static_cast<int>(plan.size()) <= partSize)
    {
        if (logCallback)
            logCallback("Rendering " + juce::String((int) plan.size()) + " slices to " + outputFile.getFullPathName());

        return toolkit.concatenate(plan, outputFile);
    }

    const auto chunks = partition(plan, partSize);

    if (static_cast<int>(chunks.size()) > partSize && logCallback)
        logCallback("WARNING: " + juce::String((int) chunks.size()) + " render parts exceed the part size of "
                    + juce::String(partSize));

    for (size_t i = 0; i < chunks.size(); ++i)
    {
        const juce::File part = workspace.getRenderPartFile(static_cast<int>(i));

        if (logCallback)
            logCallback("Rendering part " + juce::String((int) i + 1) + "/" + juce::String((int) chunks.size())
                        + " (" + juce::String((int) chunks[i].size()) + " slices)");

        if (!toolkit.concatenate(chunks[i], part))
        {
            if (logCallback)
                logCallback("ERROR: Failed to render part " + part.getFileName());
            return false;
        }

        renderParts.push_back(part);
    }

    if (logCallback)
        logCallback("Joining " + juce::String((int) renderParts.size()) + " parts into " + outputFile.getFullPathName());

    return toolkit.concatenate(renderParts, outputFile);
}
