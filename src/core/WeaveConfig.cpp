#include "WeaveConfig.h"

using WeaveTypes::ExitCode;
using WeaveTypes::WeaveStatus;

namespace
{
    // Accepts both "--opt value" and "--opt=value"
    juce::String getOptionValue(const juce::ArgumentList& args, juce::StringRef option)
    {
        const juce::String value = args.getValueForOption(option);
        if (value.isNotEmpty())
            return value;

        const int index = args.indexOfOption(option);
        if (index >= 0 && index + 1 < args.size() && !args[index + 1].isOption())
            return args[index + 1].text;

        return {};
    }

    bool parsePositiveInt(const juce::String& text, int& result)
    {
        const juce::String trimmed = text.trim();
        if (trimmed.isEmpty() || !trimmed.containsOnly("0123456789") || trimmed.length() > 9)
            return false;

        result = trimmed.getIntValue();
        return result > 0;
    }

    bool parsePositiveDouble(const juce::String& text, double& result)
    {
        const juce::String trimmed = text.trim();
        if (trimmed.isEmpty() || !trimmed.containsOnly("0123456789.") || trimmed.indexOfChar('.') != trimmed.lastIndexOfChar('.'))
            return false;

        result = trimmed.getDoubleValue();
        return result > 0.0;
    }

    juce::StringArray splitList(const juce::String& text)
    {
        juce::StringArray tokens;
        tokens.addTokens(text, ":", "");
        tokens.trim();
        tokens.removeEmptyStrings();
        return tokens;
    }
}

juce::File WeaveConfig::getDefaultTempDirectory()
{
    return juce::File::getSpecialLocation(juce::File::tempDirectory).getChildFile("SliceWeave");
}

juce::int64 WeaveConfig::sliceMillisForFps(double fps)
{
    if (!std::isfinite(fps) || fps <= 0.0)
        return 0;

    return static_cast<juce::int64>(std::floor(1000.0 / fps));
}

WeaveStatus WeaveConfig::fromArguments(const juce::ArgumentList& args, WeaveConfig& config)
{
    config = WeaveConfig();
    config.tempDirectory = getDefaultTempDirectory();

    const juce::File cwd = juce::File::getCurrentWorkingDirectory();

    for (const auto& path : splitList(getOptionValue(args, "--input")))
        config.inputs.push_back(cwd.getChildFile(path));

    if (config.inputs.size() < 2)
        return WeaveStatus::fail(ExitCode::tooFewInputs, "At least two inputs are required (--input a:b)");

    const juce::String outputPath = getOptionValue(args, "--output").trim();
    if (outputPath.isEmpty())
        return WeaveStatus::fail(ExitCode::missingOutput, "An output file is required (--output path)");

    config.output = cwd.getChildFile(outputPath);

    const juce::String patternText = getOptionValue(args, "--pattern");
    if (patternText.isNotEmpty())
    {
        for (const auto& token : splitList(patternText))
        {
            int weight = 0;
            if (!parsePositiveInt(token, weight))
                return WeaveStatus::fail(ExitCode::invalidConfiguration, "Pattern weights must be positive integers: " + patternText);

            config.pattern.push_back(weight);
        }
    }
    else
    {
        config.pattern.assign(config.inputs.size(), 1);
    }

    config.realtime = args.containsOption("--realtime");
    config.random = args.containsOption("--random");

    const juce::String tmpPath = getOptionValue(args, "--tmp").trim();
    if (tmpPath.isNotEmpty())
        config.tempDirectory = cwd.getChildFile(tmpPath);

    // --ms wins over --fps when both are given
    const juce::String msText = getOptionValue(args, "--ms");
    const juce::String fpsText = getOptionValue(args, "--fps");

    if (msText.isNotEmpty())
    {
        int millis = 0;
        if (!parsePositiveInt(msText, millis))
            return WeaveStatus::fail(ExitCode::invalidConfiguration, "Invalid --ms value: " + msText);

        config.sliceMillis = millis;
    }
    else if (fpsText.isNotEmpty())
    {
        double fps = 0.0;
        if (!parsePositiveDouble(fpsText, fps))
            return WeaveStatus::fail(ExitCode::invalidConfiguration, "Invalid --fps value: " + fpsText);

        config.sliceMillis = sliceMillisForFps(fps);
    }

    const juce::String rateText = getOptionValue(args, "--rate");
    if (rateText.isNotEmpty() && !parsePositiveInt(rateText, config.sampleRate))
        return WeaveStatus::fail(ExitCode::invalidConfiguration, "Invalid --rate value: " + rateText);

    const juce::String partText = getOptionValue(args, "--part-size");
    if (partText.isNotEmpty() && !parsePositiveInt(partText, config.partSize))
        return WeaveStatus::fail(ExitCode::invalidConfiguration, "Invalid --part-size value: " + partText);

    const juce::String timeoutText = getOptionValue(args, "--timeout");
    if (timeoutText.isNotEmpty())
    {
        double seconds = 0.0;
        if (!parsePositiveDouble(timeoutText, seconds))
            return WeaveStatus::fail(ExitCode::invalidConfiguration, "Invalid --timeout value: " + timeoutText);

        config.commandTimeoutMs = juce::roundToInt(seconds * 1000.0);
    }

    const juce::String seedText = getOptionValue(args, "--seed").trim();
    if (seedText.isNotEmpty())
    {
        if (!seedText.containsOnly("0123456789"))
            return WeaveStatus::fail(ExitCode::invalidConfiguration, "Invalid --seed value: " + seedText);

        config.hasRandomSeed = true;
        config.randomSeed = seedText.getLargeIntValue();
    }

    config.ffmpegPath = getOptionValue(args, "--ffmpeg").trim();
    config.ffprobePath = getOptionValue(args, "--ffprobe").trim();

    const juce::String logPath = getOptionValue(args, "--log").trim();
    if (logPath.isNotEmpty())
        config.logDirectory = cwd.getChildFile(logPath);

    return config.validate();
}

WeaveStatus WeaveConfig::validate() const
{
    if (inputs.size() < 2)
        return WeaveStatus::fail(ExitCode::tooFewInputs, "At least two inputs are required");

    if (output == juce::File())
        return WeaveStatus::fail(ExitCode::missingOutput, "An output file is required");

    if (pattern.size() != inputs.size())
        return WeaveStatus::fail(ExitCode::invalidConfiguration,
                                 "Pattern has " + juce::String((int) pattern.size()) + " entries but there are "
                                     + juce::String((int) inputs.size()) + " inputs");

    for (int weight : pattern)
        if (weight <= 0)
            return WeaveStatus::fail(ExitCode::invalidConfiguration, "Pattern weights must be positive");

    if (sliceMillis <= 0)
        return WeaveStatus::fail(ExitCode::invalidConfiguration, "Slice length must be at least 1 ms");

    if (sampleRate <= 0 || channels <= 0 || partSize <= 0)
        return WeaveStatus::fail(ExitCode::invalidConfiguration, "Sample rate, channels and part size must be positive");

    return WeaveStatus::ok();
}

juce::String WeaveConfig::getUsage()
{
    return "Usage: SliceWeave --input a:b[:c...] --output path [options]\n"
           "\n"
           "  --input a:b:c       Colon separated input files (at least two)\n"
           "  --output path       File to write the woven track to\n"
           "  --pattern n:n:n     Per input weights, one per input (default all 1)\n"
           "  --realtime          Drop slices periodically to keep original pacing\n"
           "  --random            Shuffle slices instead of following the pattern\n"
           "  --fps N             Slices per second (default 24)\n"
           "  --ms N              Slice length in milliseconds, overrides --fps\n"
           "  --tmp dir           Staging directory (wiped at start and end)\n"
           "  --rate N            Sample rate of the extracted slices (default 44100)\n"
           "  --part-size N       Slices per intermediate render chunk (default 500)\n"
           "  --seed N            Seed for --random\n"
           "  --timeout seconds   Kill any ffmpeg/ffprobe call that runs longer\n"
           "  --ffmpeg path       ffmpeg executable\n"
           "  --ffprobe path      ffprobe executable\n"
           "  --log dir           Also write the session and ffmpeg logs to dir\n";
}
