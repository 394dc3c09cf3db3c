#include "FormatConverter.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <system_error>

#include "ScopedTempDir.hpp"
#include "Subprocess.hpp"

namespace certgen {

std::vector<std::string> FormatConverter::commandLine(const std::filesystem::path& workDir,
                                                      const std::filesystem::path& input) const {
  return {
    opts_.executable,
    "--headless",
    "--invisible",
    "--nologo",
    "--nodefault",
    "--nolockcheck",
    "--norestore",
    "--nofirststartwizard",
    "-env:UserInstallation=file://" + (workDir / "profile").string(),
    "--convert-to", opts_.targetExtension,
    "--outdir", (workDir / "out").string(),
    input.string()
  };
}

Result<Bytes> FormatConverter::convert(const Bytes& document) const {
  namespace fs = std::filesystem;

  try {
    ScopedTempDir work("certgen-convert-");
    const fs::path input = work.path() / "document.docx";
    const fs::path output = work.path() / "out" / ("document." + opts_.targetExtension);

    fs::create_directories(work.path() / "out");
    {
      std::ofstream os(input, std::ios::binary);
      os.write(reinterpret_cast<const char*>(document.data()), static_cast<std::streamsize>(document.size()));
      if (!os) {
        return Result<Bytes>::fail(ErrorCode::ConversionProcessError,
                                   "cannot stage document in " + work.path().string());
      }
    }

    const auto argv = commandLine(work.path(), input);
    spdlog::debug("converting {} bytes with {} in {}", document.size(), opts_.executable, work.path().string());

    const ProcessResult pr = run_process(
      argv,
      std::chrono::duration_cast<std::chrono::milliseconds>(opts_.timeout),
      work.path() / "convert.log",
      {{"HOME", work.path().string()}});

    if (!pr.launched) {
      return Result<Bytes>::fail(ErrorCode::ConversionProcessError, pr.launchError);
    }
    if (pr.timedOut) {
      return Result<Bytes>::fail(ErrorCode::ConversionProcessError,
        "conversion timed out after " + std::to_string(opts_.timeout.count()) + "s");
    }
    if (pr.termSignal != 0) {
      return Result<Bytes>::fail(ErrorCode::ConversionProcessError,
        "converter killed by signal " + std::to_string(pr.termSignal) + ": " + pr.outputTail);
    }
    if (pr.exitCode != 0) {
      return Result<Bytes>::fail(ErrorCode::ConversionProcessError,
        "converter exited with code " + std::to_string(pr.exitCode) + ": " + pr.outputTail);
    }

    std::error_code ec;
    if (!fs::is_regular_file(output, ec) || fs::file_size(output, ec) == 0) {
      return Result<Bytes>::fail(ErrorCode::ConversionOutputMissing,
        "converter exited cleanly but produced no " + opts_.targetExtension + " output" +
        (pr.outputTail.empty() ? std::string() : ": " + pr.outputTail));
    }

    std::ifstream in(output, std::ios::binary);
    Bytes out((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
      return Result<Bytes>::fail(ErrorCode::ConversionOutputMissing, "cannot read " + output.string());
    }
    spdlog::debug("conversion produced {} bytes", out.size());
    return out;
  } catch (const std::exception& e) {
    return Result<Bytes>::fail(ErrorCode::ConversionProcessError,
                               std::string("conversion failed: ") + e.what());
  }
}

} // namespace certgen
