/// @file keyscope_cli.cpp
/// @brief Command-line interface for keyscope key detection.

#include <cmath>
#include <cstdio>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "keyscope.h"

using namespace keyscope;

// ============================================================================
// JSON Builder - Fluent interface for building JSON output
// ============================================================================

class JsonBuilder {
 public:
  JsonBuilder& begin_object() {
    append_separator();
    ss_ << "{";
    needs_comma_.push_back(false);
    return *this;
  }

  JsonBuilder& end_object() {
    ss_ << "}";
    needs_comma_.pop_back();
    if (!needs_comma_.empty()) needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& begin_array() {
    append_separator();
    ss_ << "[";
    needs_comma_.push_back(false);
    return *this;
  }

  JsonBuilder& end_array() {
    ss_ << "]";
    needs_comma_.pop_back();
    if (!needs_comma_.empty()) needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& key(const std::string& k) {
    append_separator();
    ss_ << "\"" << escape(k) << "\": ";
    needs_comma_.back() = false;
    return *this;
  }

  JsonBuilder& value(const std::string& v) {
    append_separator();
    ss_ << "\"" << escape(v) << "\"";
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(const char* v) { return value(std::string(v)); }

  JsonBuilder& value(int v) {
    append_separator();
    ss_ << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(size_t v) {
    append_separator();
    ss_ << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(double v) {
    append_separator();
    ss_ << std::setprecision(15) << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& null_value() {
    append_separator();
    ss_ << "null";
    needs_comma_.back() = true;
    return *this;
  }

  // Convenience: key-value pairs
  JsonBuilder& kv(const std::string& k, const std::string& v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, const char* v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, int v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, size_t v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, double v) { return key(k).value(v); }

  // Array of floats
  JsonBuilder& float_array(const std::vector<float>& arr) {
    begin_array();
    for (float v : arr) value(static_cast<double>(v));
    end_array();
    return *this;
  }

  std::string build() const { return ss_.str(); }
  void print() const { std::cout << ss_.str() << "\n"; }

 private:
  void append_separator() {
    if (!needs_comma_.empty() && needs_comma_.back()) {
      ss_ << ", ";
    }
  }

  static std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
      switch (c) {
        case '"':
          result += "\\\"";
          break;
        case '\\':
          result += "\\\\";
          break;
        case '\n':
          result += "\\n";
          break;
        case '\t':
          result += "\\t";
          break;
        default:
          result += c;
      }
    }
    return result;
  }

  std::ostringstream ss_;
  std::vector<bool> needs_comma_;
};

// ============================================================================
// CLI Arguments
// ============================================================================

struct CliArgs {
  std::string command;
  std::vector<std::string> positionals;
  std::string output_file;
  bool json_output = false;
  bool quiet = false;
  bool help = false;
  bool show_scores = false;

  std::map<std::string, std::string> options;

  const std::string& input_file() const {
    static const std::string empty;
    return positionals.empty() ? empty : positionals.front();
  }

  float get_float(const std::string& k, float def) const {
    auto it = options.find(k);
    return it != options.end() ? std::stof(it->second) : def;
  }

  double get_double(const std::string& k, double def) const {
    auto it = options.find(k);
    return it != options.end() ? std::stod(it->second) : def;
  }

  int get_int(const std::string& k, int def) const {
    auto it = options.find(k);
    return it != options.end() ? std::stoi(it->second) : def;
  }

  bool has(const std::string& k) const { return options.count(k) > 0; }

  std::string get_string(const std::string& k, const std::string& def = "") const {
    auto it = options.find(k);
    return it != options.end() ? it->second : def;
  }
};

// ============================================================================
// Argument Parser
// ============================================================================

class ArgParser {
 public:
  static CliArgs parse(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
      } else if (arg == "--json") {
        args.json_output = true;
      } else if (arg == "--quiet" || arg == "-q") {
        args.quiet = true;
      } else if (arg == "--show-scores") {
        args.show_scores = true;
      } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
        args.output_file = argv[++i];
      } else if (arg.size() > 2 && arg.substr(0, 2) == "--" && i + 1 < argc) {
        args.options[arg.substr(2)] = argv[++i];
      } else if (args.command.empty()) {
        args.command = arg;
      } else {
        args.positionals.push_back(arg);
      }
    }

    return args;
  }
};

// ============================================================================
// Helpers
// ============================================================================

bool file_exists(const std::string& path) {
  std::ifstream f(path);
  return f.good();
}

KeyDetectorConfig detector_config(const CliArgs& args) {
  KeyDetectorConfig config;
  config.spectrum.window_length = args.get_int("window-length", config.spectrum.window_length);
  config.spectrum.hop_length = args.get_int("hop-length", config.spectrum.hop_length);
  config.pitch_class.fmin = args.get_float("fmin", config.pitch_class.fmin);
  config.pitch_class.fmax = args.get_float("fmax", config.pitch_class.fmax);
  if (args.has("threshold")) {
    config.classifier.single_tone_threshold = args.get_double("threshold", 0.0);
  }
  return config;
}

std::string spectrum_json(const SpectrumFrame& spectrum) {
  JsonBuilder json;
  json.begin_object()
      .kv("sample_rate", spectrum.sample_rate())
      .kv("n_segments", spectrum.n_segments())
      .key("frequencies")
      .float_array(spectrum.frequencies())
      .key("magnitudes")
      .float_array(spectrum.magnitudes())
      .key("labels")
      .begin_array();
  for (const auto& label : spectrum_note_labels(spectrum)) {
    json.begin_object()
        .kv("frequency", static_cast<double>(label.frequency))
        .kv("note", label.note)
        .end_object();
  }
  json.end_array().end_object();
  return json.build();
}

void write_text_file(const std::string& path, const std::string& content) {
  std::ofstream out(path);
  KEYSCOPE_CHECK_MSG(out.is_open(), ErrorCode::InvalidParameter, "Cannot write file: " + path);
  out << content << "\n";
  KEYSCOPE_CHECK_MSG(out.good(), ErrorCode::InvalidParameter, "Failed to write file: " + path);
}

std::string format_score(double score) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(4) << score;
  return ss.str();
}

// ============================================================================
// Command Handler Type
// ============================================================================

using CommandHandler = std::function<int(const CliArgs&, const Audio&)>;

// ============================================================================
// Command Implementations
// ============================================================================

int cmd_version(const CliArgs& args) {
  if (args.json_output) {
    JsonBuilder().begin_object().kv("cli_version", "1.0.0").kv("lib_version", version()).end_object().print();
  } else {
    std::cout << "keyscope-cli version 1.0.0\n";
    std::cout << "libkeyscope version " << version() << "\n";
  }
  return 0;
}

int cmd_info(const CliArgs& args, const Audio& audio) {
  if (args.json_output) {
    JsonBuilder()
        .begin_object()
        .kv("path", args.input_file())
        .kv("duration", static_cast<double>(audio.duration()))
        .kv("sample_rate", audio.sample_rate())
        .kv("samples", audio.size())
        .end_object()
        .print();
  } else {
    std::cout << "Audio File: " << args.input_file() << "\n";
    std::cout << "  Duration:    " << std::fixed << std::setprecision(2) << audio.duration()
              << "s\n";
    std::cout << "  Sample Rate: " << audio.sample_rate() << " Hz\n";
    std::cout << "  Samples:     " << audio.size() << "\n";
  }
  return 0;
}

int cmd_key(const CliArgs& args, const Audio& audio) {
  const KeyDetectorConfig config = detector_config(args);
  KeyDetector detector(audio, config);
  const KeyDetection& detection = detector.detection();

  if (args.has("spectrum-out")) {
    std::string path = args.get_string("spectrum-out");
    write_text_file(path, spectrum_json(detector.spectrum()));
    if (!args.quiet && !args.json_output) {
      std::cerr << "Spectrum saved as " << path << "\n";
    }
  }

  if (args.json_output) {
    JsonBuilder json;
    json.begin_object()
        .kv("kind", detection_kind_name(detection.kind))
        .kv("root", pitch_class_name(detection.root))
        .key("scale");
    if (detection.scale) {
      json.value(scale_name(*detection.scale));
    } else {
      json.null_value();
    }
    json.kv("score", detection.score)
        .kv("name", detection.to_string())
        .kv("threshold", config.classifier.single_tone_threshold);
    if (args.show_scores) {
      json.key("scores").begin_array();
      for (const auto& c : detector.candidates()) {
        json.begin_object()
            .kv("type", scale_category_name(c.category()))
            .kv("root", pitch_class_name(c.root))
            .kv("scale", scale_name(c.scale))
            .kv("score", c.score)
            .end_object();
      }
      json.end_array();
    }
    json.end_object().print();
    return 0;
  }

  if (detection.kind == DetectionKind::SingleTone) {
    std::cout << "Detected Key: " << detection.to_string() << "\n";
    return 0;
  }

  if (args.show_scores) {
    std::cout << "\nScores for all keys and modes:\n";
    for (const auto& c : detector.candidates()) {
      std::cout << scale_category_name(c.category()) << ": " << c.to_string()
                << " - Score: " << format_score(c.score) << "\n";
    }
  }

  std::cout << "\nDetected " << detection_kind_name(detection.kind) << ": "
            << detection.to_string() << "\n";
  return 0;
}

int cmd_spectrum(const CliArgs& args, const Audio& audio) {
  KeyDetectorConfig config = detector_config(args);
  SpectrumFrame spectrum = SpectrumFrame::compute(audio, config.spectrum);

  std::string json = spectrum_json(spectrum);
  if (args.output_file.empty()) {
    std::cout << json << "\n";
  } else {
    write_text_file(args.output_file, json);
    if (!args.quiet) {
      std::cerr << "Spectrum saved as " << args.output_file << "\n";
    }
  }
  return 0;
}

// ============================================================================
// Tone / scale generator
// ============================================================================

std::vector<float> sine_wave(double frequency, size_t n_samples, int sample_rate) {
  constexpr double kTwoPi = 2.0 * 3.14159265358979323846;
  std::vector<float> samples(n_samples);
  for (size_t i = 0; i < n_samples; ++i) {
    samples[i] = static_cast<float>(std::sin(kTwoPi * frequency * i / sample_rate));
  }
  return samples;
}

int cmd_synth(const CliArgs& args) {
  if (args.positionals.size() < 2 || args.output_file.empty()) {
    std::cerr << "Error: synth needs a type (tone|scale), a note and -o <file>\n";
    return 1;
  }

  const std::string& type = args.positionals[0];
  int sample_rate = args.get_int("sample-rate", 44100);
  KEYSCOPE_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter, "Invalid sample rate");

  std::vector<float> samples;
  if (type == "tone") {
    double frequency = note_to_hz(args.positionals[1]);
    KEYSCOPE_CHECK_MSG(frequency > 0.0, ErrorCode::InvalidParameter,
                       "Unknown note: " + args.positionals[1]);
    float duration = args.get_float("duration", 1.0f);
    KEYSCOPE_CHECK_MSG(duration > 0.0f, ErrorCode::InvalidParameter, "Invalid duration");
    samples = sine_wave(frequency, static_cast<size_t>(duration * sample_rate), sample_rate);
  } else if (type == "scale") {
    if (args.positionals.size() < 3) {
      std::cerr << "Error: synth scale needs a root and a scale name\n";
      return 1;
    }
    PitchClass root = parse_pitch_class(args.positionals[1]);
    ScaleType scale = parse_scale_type(args.positionals[2]);

    // Eight notes of 2/7 s each, ascending from the root in octave 4
    size_t note_samples = static_cast<size_t>(sample_rate * 2 / 7);
    const auto& intervals = scale_definition(scale).intervals;
    int midi = 60 + static_cast<int>(root);
    for (size_t n = 0; n <= intervals.size(); ++n) {
      auto note = sine_wave(midi_to_hz(midi), note_samples, sample_rate);
      samples.insert(samples.end(), note.begin(), note.end());
      if (n < intervals.size()) midi += intervals[n];
    }
  } else {
    std::cerr << "Error: Unknown synth type '" << type << "'\n";
    return 1;
  }

  normalize_peak(samples);
  save_wav(args.output_file, samples, sample_rate);
  if (!args.quiet) {
    std::cerr << "Generated: " << args.output_file << "\n";
  }
  return 0;
}

// ============================================================================
// Command Registry
// ============================================================================

struct CommandInfo {
  std::string name;
  std::string description;
  CommandHandler handler;
};

const std::vector<CommandInfo>& get_commands() {
  static std::vector<CommandInfo> commands = {
      {"key", "Detect key, mode or single tone", cmd_key},
      {"spectrum", "Export averaged spectrum with note labels (JSON)", cmd_spectrum},
      {"info", "Show audio file information", cmd_info},
  };
  return commands;
}

const CommandInfo* find_command(const std::string& name) {
  for (const auto& cmd : get_commands()) {
    if (cmd.name == name) return &cmd;
  }
  return nullptr;
}

// ============================================================================
// Usage
// ============================================================================

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <command> [options] <audio_file>\n\n";

  std::cerr << "ANALYSIS COMMANDS:\n";
  for (const auto& cmd : get_commands()) {
    fprintf(stderr, "  %-14s %s\n", cmd.name.c_str(), cmd.description.c_str());
  }
  std::cerr << "\nUTILITY COMMANDS:\n";
  std::cerr << "  synth          Generate a test tone or scale WAV\n";
  std::cerr << "  version        Show library version\n";

  std::cerr << "\nOPTIONS:\n"
            << "  --json                  Output results in JSON format\n"
            << "  --quiet, -q             Suppress progress output\n"
            << "  --help, -h              Show help\n"
            << "  --show-scores           Print every key and mode score (key)\n"
            << "  --spectrum-out <file>   Save spectrum and note labels as JSON (key)\n"
            << "  -o, --output <file>     Output file path (spectrum, synth)\n"
            << "  --window-length <int>   Analysis window (default: 4096)\n"
            << "  --hop-length <int>      Hop length (default: 2048)\n"
            << "  --fmin <hz>, --fmax <hz> Folding range (default: 20-5000)\n"
            << "  --threshold <float>     Single-tone threshold (default: 0.4)\n"
            << "  --duration <sec>        Tone length (synth tone, default: 1)\n"
            << "  --sample-rate <hz>      Output rate (synth, default: 44100)\n"
            << "\nExamples:\n"
            << "  " << prog << " key music.mp3 --show-scores\n"
            << "  " << prog << " spectrum music.wav -o spectrum.json\n"
            << "  " << prog << " synth scale C \"Natural Minor\" -o c_minor.wav\n";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  CliArgs args = ArgParser::parse(argc, argv);

  if (args.help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command.empty()) {
    std::cerr << "Error: No command specified\n\n";
    print_usage(argv[0]);
    return 1;
  }

  try {
    if (args.command == "version") {
      return cmd_version(args);
    }
    if (args.command == "synth") {
      return cmd_synth(args);
    }

    const CommandInfo* cmd = find_command(args.command);
    if (!cmd) {
      std::cerr << "Error: Unknown command '" << args.command << "'\n\n";
      print_usage(argv[0]);
      return 1;
    }

    if (args.input_file().empty()) {
      std::cerr << "Error: Missing audio file\n\n";
      print_usage(argv[0]);
      return 1;
    }

    if (!file_exists(args.input_file())) {
      std::cerr << "Error: '" << args.input_file() << "' not found.\n";
      return 1;
    }

    if (!args.quiet && !args.json_output) {
      std::cerr << "Loading " << args.input_file() << "...\n";
    }

    Audio audio = Audio::from_file(args.input_file());

    if (!args.quiet && !args.json_output) {
      std::cerr << "Loaded " << audio.duration() << "s @ " << audio.sample_rate() << "Hz\n";
    }

    return cmd->handler(args, audio);

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
