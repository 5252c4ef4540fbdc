#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>
#include "clinical/embedding_model.hpp"
#include "clinical/note_generator.hpp"
#include "clinical/vocabulary_store.hpp"
#include "core/encounter_pipeline.hpp"
#include "core/engine_config.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"

using namespace clinscribe;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] [transcript-file | -]\n"
              << "Options:\n"
              << "  --config <file>        Engine configuration (default: config/clinscribe.json)\n"
              << "  --vocabulary <file>    Extra vocabulary JSON merged into the built-in tables\n"
              << "  --embeddings <file>    Word vectors for sentence deduplication\n"
              << "  --candidates <file>    Fuse per-window transcription candidates from JSON\n"
              << "  --note-type <type>     SOAP, ED_NOTE, PROGRESS, CONSULT, HANDOFF, DISCHARGE\n"
              << "  --phase <phase>        initial or followup (ED notes)\n"
              << "  --encounter-id <id>    Encounter identifier (default: encounter)\n"
              << "  --log-level <level>    DEBUG, INFO, WARN, ERROR\n"
              << "  --help, -h             Show this help message\n";
}

std::string readAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string readTranscript(const std::string& path) {
    if (path == "-") {
        return readAll(std::cin);
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open transcript file: " + path);
    }
    return readAll(file);
}

fusion::TranscriptionCandidate parseCandidate(const utils::JsonValue& value) {
    fusion::TranscriptionCandidate candidate(value.getString("provider", "unknown"),
                                             value.getString("text"),
                                             static_cast<float>(value.getNumber("confidence", 0.0)),
                                             value.getBool("specialized", false));
    if (value.hasProperty("segments") && value.getProperty("segments").isArray()) {
        for (const auto& seg : value.getProperty("segments").asArray()) {
            candidate.segments.emplace_back(seg.getString("text"), seg.getNumber("start", 0.0),
                                            seg.getNumber("end", 0.0),
                                            static_cast<float>(seg.getNumber("confidence", 0.0)));
        }
    }
    return candidate;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        utils::Logger::initialize();

        std::string config_path = "config/clinscribe.json";
        std::string vocabulary_path;
        std::string embeddings_path;
        std::string candidates_path;
        std::string transcript_path;
        std::string note_type_name;
        std::string phase_name = "initial";
        std::string encounter_id = "encounter";
        std::string log_level;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--vocabulary" && i + 1 < argc) {
                vocabulary_path = argv[++i];
            } else if (arg == "--embeddings" && i + 1 < argc) {
                embeddings_path = argv[++i];
            } else if (arg == "--candidates" && i + 1 < argc) {
                candidates_path = argv[++i];
            } else if (arg == "--note-type" && i + 1 < argc) {
                note_type_name = argv[++i];
            } else if (arg == "--phase" && i + 1 < argc) {
                phase_name = argv[++i];
            } else if (arg == "--encounter-id" && i + 1 < argc) {
                encounter_id = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                log_level = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "-" || arg.rfind("--", 0) != 0) {
                transcript_path = arg;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 2;
            }
        }

        core::EngineConfigManager config_manager;
        if (!config_manager.loadFromFile(config_path)) {
            throw utils::ConfigurationException("Invalid configuration", config_path);
        }
        core::EngineConfig config = config_manager.getConfig();

        utils::Logger::setLevel(utils::Logger::parseLevel(log_level.empty() ? config.logging.level : log_level));

        clinical::NoteType note_type = clinical::NoteType::SOAP;
        std::string type_name = note_type_name.empty() ? config.notes.defaultNoteType : note_type_name;
        if (!clinical::parseNoteType(type_name, note_type)) {
            throw utils::ConfigurationException("Unknown note type", type_name);
        }
        clinical::EncounterPhase phase = clinical::EncounterPhase::INITIAL;
        if (!clinical::parseEncounterPhase(phase_name, phase)) {
            throw utils::ConfigurationException("Unknown encounter phase", phase_name);
        }

        if (vocabulary_path.empty()) {
            vocabulary_path = config.extraction.vocabularyPath;
        }
        clinical::VocabularyStorePtr vocabulary = vocabulary_path.empty()
            ? clinical::VocabularyStore::createDefault()
            : clinical::VocabularyStore::loadFromFile(vocabulary_path);

        utils::ErrorHandler error_handler;

        if (embeddings_path.empty()) {
            embeddings_path = config.deduplication.embeddingsPath;
        }
        std::shared_ptr<const clinical::EmbeddingModel> embeddings;
        if (!embeddings_path.empty()) {
            try {
                embeddings = clinical::WordVectorTable::loadFromFile(embeddings_path);
            } catch (const utils::EmbeddingUnavailableException& e) {
                error_handler.reportError(e, "main");
            }
        }

        clinical::NoteResponse response;
        if (!candidates_path.empty()) {
            utils::JsonValue root = utils::JsonParser::parseFile(candidates_path);
            core::EncounterPipeline pipeline(encounter_id, config, {}, vocabulary, embeddings, error_handler);

            const auto& windows = root.getProperty("windows");
            if (!windows.isArray()) {
                throw utils::EmptyInputException("Candidate file has no 'windows' array", encounter_id);
            }
            size_t index = 0;
            for (const auto& window : windows.asArray()) {
                std::vector<fusion::TranscriptionCandidate> candidates;
                for (const auto& item : window.getProperty("candidates").asArray()) {
                    candidates.push_back(parseCandidate(item));
                }
                std::string window_id = window.getString("id", "window-" + std::to_string(index++));
                auto result = pipeline.processCandidates(window_id, candidates);
                utils::Logger::info("Window " + window_id + ": \"" + result.fused.text + "\" (confidence " +
                                    std::to_string(result.fused.confidence) + ")");
            }
            std::cout << "Fused transcript (confidence " << pipeline.getTranscript().getConfidence() << "):\n"
                      << pipeline.getTranscript().getText() << "\n\n";
            response = pipeline.generateNote(note_type, phase);
        } else {
            if (transcript_path.empty()) {
                printUsage(argv[0]);
                return 2;
            }
            clinical::NoteGenerator generator(vocabulary, embeddings, config, error_handler);
            clinical::NoteRequest request(readTranscript(transcript_path), note_type, encounter_id, phase);
            response = generator.generate(request);
        }

        std::cout << response.rendered_note << "\n";
        std::cout << "Quality score: " << response.quality_score << "\n";
        if (!response.json_projection.empty()) {
            std::cout << "\n" << response.json_projection << "\n";
        }
        for (const auto& warning : response.warnings) {
            std::cerr << "Warning: " << warning.message << " (" << warning.details << ")\n";
        }

    } catch (const utils::ClinScribeException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
