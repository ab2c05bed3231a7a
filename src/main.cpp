#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QFile>
#include <QTextStream>

#include <string>
#include <vector>

#include "gbasave/app/TableLoader.h"
#include "gbasave/codec/LiveParty.h"
#include "gbasave/codec/MemorySource.h"
#include "gbasave/codec/Profiles.h"
#include "gbasave/codec/SaveDocument.h"
#include "gbasave/common/Dotenv.h"
#include "gbasave/common/Logger.h"
#include "gbasave/common/Logging.h"

using GBASave::Common::Logger;
using GBASave::Common::LogLevel;
using namespace GBASave::Codec;

namespace {

// Everything the commands print goes to the real stdout. std::cout is
// captured into the log file once InitAppLogging runs.
QTextStream& Out() {
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& Err() {
    static QTextStream stream(stderr);
    return stream;
}

bool ReadFileBytes(const QString& path, std::vector<uint8_t>& out) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        Err() << "cannot open " << path << ": " << file.errorString() << Qt::endl;
        return false;
    }
    const QByteArray data = file.readAll();
    out.assign(data.begin(), data.end());
    return true;
}

bool WriteFileBytes(const QString& path, const std::vector<uint8_t>& bytes) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        Err() << "cannot write " << path << ": " << file.errorString() << Qt::endl;
        return false;
    }
    const qint64 size = static_cast<qint64>(bytes.size());
    return file.write(reinterpret_cast<const char*>(bytes.data()), size) == size;
}

bool ParseStat(const QString& name, Stat& out) {
    const QString v = name.trimmed().toLower();
    if (v == "hp") out = Stat::Hp;
    else if (v == "atk" || v == "attack") out = Stat::Attack;
    else if (v == "def" || v == "defense") out = Stat::Defense;
    else if (v == "spe" || v == "speed") out = Stat::Speed;
    else if (v == "spa" || v == "spatk") out = Stat::SpAttack;
    else if (v == "spd" || v == "spdef") out = Stat::SpDefense;
    else return false;
    return true;
}

// "atk=252" -> (Attack, 252)
bool ParseStatAssignment(const QString& text, Stat& stat, int& value) {
    const QStringList parts = text.split('=');
    if (parts.size() != 2 || !ParseStat(parts[0], stat)) return false;
    bool ok = false;
    value = parts[1].trimmed().toInt(&ok);
    return ok;
}

const char* ShinyName(ShinyClass shiny) {
    switch (shiny) {
        case ShinyClass::Normal: return "normal";
        case ShinyClass::Shiny: return "shiny";
        case ShinyClass::Radiant: return "radiant";
    }
    return "normal";
}

int Fail(SaveStatus status, const QString& what) {
    Logger::Instance().LogFmt(LogLevel::Error, "main", "%s: %s", what.toStdString().c_str(), StatusName(status));
    Err() << what << ": " << StatusName(status) << Qt::endl;
    return 1;
}

SaveStatus LoadSave(const std::vector<uint8_t>& image, const std::vector<GameProfile>& profiles,
                    const QString& profileName, const ParseOptions& options, SaveDocument& doc) {
    if (profileName.isEmpty()) {
        return SaveDocument::LoadDetect(image, profiles, doc, options);
    }
    const GameProfile* profile = FindProfile(profiles, profileName.toStdString());
    if (!profile) return SaveStatus::UnsupportedGame;
    return SaveDocument::Load(image, *profile, doc, options);
}

void PrintMember(size_t index, const CreatureRecord& record) {
    const CreatureData d = record.Decode();
    QString species = d.speciesName.empty() ? QString("#%1").arg(d.speciesId)
                                            : QString("%1 (#%2)").arg(QString::fromStdString(d.speciesName)).arg(d.speciesId);
    Out() << QString("%1. %2 \"%3\" Lv %4  %5  %6  OT %7 (%8)")
                 .arg(index + 1)
                 .arg(species)
                 .arg(QString::fromStdString(d.nickname))
                 .arg(static_cast<int>(d.level))
                 .arg(QString::fromLatin1(NatureName(d.nature)))
                 .arg(QString::fromLatin1(ShinyName(d.shinyClass)))
                 .arg(QString::fromStdString(d.otName))
                 .arg(static_cast<int>(record.DisplayOtId()), 5, 10, QChar('0'))
          << Qt::endl;
    Out() << QString("   HP %1/%2  Atk %3  Def %4  Spe %5  SpA %6  SpD %7  item %8")
                 .arg(d.currentHp).arg(d.stats[0]).arg(d.stats[1]).arg(d.stats[2])
                 .arg(d.stats[3]).arg(d.stats[4]).arg(d.stats[5]).arg(d.itemId)
          << Qt::endl;
    QStringList evs;
    QStringList ivs;
    for (int i = 0; i < kStatCount; ++i) {
        evs << QString::number(d.evs[i]);
        ivs << QString::number(d.ivs[i]);
    }
    Out() << "   EV " << evs.join('/') << " (" << record.EVTotal() << ")  IV " << ivs.join('/') << " ("
          << record.IVTotal() << ")" << Qt::endl;
    Out() << "   moves " << d.moves[0] << "/" << d.moves[1] << "/" << d.moves[2] << "/" << d.moves[3] << "  pp "
          << static_cast<int>(d.pp[0]) << "/" << static_cast<int>(d.pp[1]) << "/" << static_cast<int>(d.pp[2]) << "/"
          << static_cast<int>(d.pp[3]) << Qt::endl;
}

int RunInfo(const SaveDocument& doc) {
    const SlotResolution& slot = doc.Slot();
    const PlayTime time = doc.GetPlayTime();
    Out() << "profile:  " << QString::fromStdString(doc.Profile().name) << Qt::endl;
    Out() << "slot:     " << (slot.range == SlotRange::A ? "A" : "B") << (slot.forced ? " (forced)" : "")
          << "  sumA=" << slot.sumA << " sumB=" << slot.sumB << Qt::endl;
    Out() << "player:   " << QString::fromStdString(doc.PlayerName()) << Qt::endl;
    Out() << "played:   " << time.hours << ":" << QString("%1").arg(static_cast<int>(time.minutes), 2, 10, QChar('0')) << ":"
          << QString("%1").arg(static_cast<int>(time.seconds), 2, 10, QChar('0')) << Qt::endl;
    Out() << "party:    " << doc.Roster().size() << " (stored count " << doc.StoredPartyCount() << ", "
          << RosterStopReasonName(doc.RosterStop()) << ")" << Qt::endl;
    for (size_t i = 0; i < doc.Roster().size(); ++i) {
        PrintMember(i, doc.Roster()[i]);
    }
    return 0;
}

int RunSectors(const SaveDocument& doc) {
    Out() << "index  id  checksum  computed  counter     state" << Qt::endl;
    for (const Sector& sector : doc.Sectors()) {
        Out() << QString("%1  %2  0x%3    0x%4    %5  %6")
                     .arg(sector.index, 5)
                     .arg(sector.logicalId, 2)
                     .arg(sector.storedChecksum, 4, 16, QChar('0'))
                     .arg(sector.computedChecksum, 4, 16, QChar('0'))
                     .arg(sector.counter, 10)
                     .arg(QString::fromLatin1(SectorFaultName(sector.fault)))
              << Qt::endl;
    }
    return 0;
}

struct SetRequest {
    int member = 1;
    QStringList evs;
    QStringList ivs;
    QString nature;
    QString item;
    QString output;
};

int RunSet(SaveDocument& doc, const SetRequest& req) {
    if (req.output.isEmpty()) {
        Err() << "set: --output is required" << Qt::endl;
        return 1;
    }
    CreatureRecord* record = doc.Member(static_cast<size_t>(req.member - 1));
    if (!record) {
        Err() << "set: no party member " << req.member << " (party has " << doc.Roster().size() << ")" << Qt::endl;
        return 1;
    }

    for (const QString& assignment : req.evs) {
        Stat stat = Stat::Hp;
        int value = 0;
        if (!ParseStatAssignment(assignment, stat, value)) return Fail(SaveStatus::InvalidArgument, "--ev " + assignment);
        SaveStatus status = record->SetEV(stat, value);
        if (status != SaveStatus::Ok) return Fail(status, "--ev " + assignment);
    }
    for (const QString& assignment : req.ivs) {
        Stat stat = Stat::Hp;
        int value = 0;
        if (!ParseStatAssignment(assignment, stat, value)) return Fail(SaveStatus::InvalidArgument, "--iv " + assignment);
        SaveStatus status = record->SetIV(stat, value);
        if (status != SaveStatus::Ok) return Fail(status, "--iv " + assignment);
    }
    if (!req.nature.isEmpty()) {
        Nature nature = Nature::Hardy;
        if (!ParseNature(req.nature.toStdString(), nature)) return Fail(SaveStatus::InvalidArgument, "--nature " + req.nature);
        SaveStatus status = record->SetNature(nature);
        if (status != SaveStatus::Ok) return Fail(status, "--nature " + req.nature);
    }
    if (!req.item.isEmpty()) {
        bool ok = false;
        const uint32_t item = req.item.toUInt(&ok, 0);
        if (!ok || item > 0xFFFF) return Fail(SaveStatus::InvalidArgument, "--item " + req.item);
        SaveStatus status = record->SetItem(static_cast<uint16_t>(item));
        if (status != SaveStatus::Ok) return Fail(status, "--item " + req.item);
    }

    std::vector<uint8_t> patched;
    SaveStatus status = doc.Reconstruct(patched);
    if (status != SaveStatus::Ok) return Fail(status, "reconstruct");
    if (!WriteFileBytes(req.output, patched)) return 1;

    Logger::Instance().LogFmt(LogLevel::Info, "main", "Wrote %zu bytes to %s", patched.size(),
                              req.output.toStdString().c_str());
    PrintMember(static_cast<size_t>(req.member - 1), *record);
    return 0;
}

int RunLiveDump(const std::vector<uint8_t>& ram, uint32_t base, const GameProfile& profile) {
    SnapshotMemorySource source(base, ram);
    LiveParty live(source, profile);
    std::vector<CreatureRecord> party;
    SaveStatus status = live.Read(party);
    if (status != SaveStatus::Ok) return Fail(status, "live-dump");

    Out() << "profile:  " << QString::fromStdString(profile.name) << Qt::endl;
    Out() << "party:    " << party.size() << Qt::endl;
    for (size_t i = 0; i < party.size(); ++i) {
        PrintMember(i, party[i]);
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("gbasave");
    app.setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("GBA Pokemon save inspector and editor");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "info | sectors | set | live-dump");
    parser.addPositionalArgument("file", "Save image (or RAM snapshot for live-dump)");

    QCommandLineOption profileOption(QStringList() << "p" << "profile",
        "Force a profile instead of detecting it (emerald, quetzal)",
        "name");
    parser.addOption(profileOption);

    QCommandLineOption slotOption(QStringList() << "slot",
        "Force the active save slot (a or b)",
        "slot");
    parser.addOption(slotOption);

    QCommandLineOption logOption(QStringList() << "l" << "log-file",
        "Log file path (default: gbasave.log)",
        "log-path",
        "gbasave.log");
    parser.addOption(logOption);

    QCommandLineOption speciesOption(QStringList() << "species-map", "Species id table (JSON)", "path");
    QCommandLineOption itemOption(QStringList() << "item-map", "Item id table (JSON)", "path");
    QCommandLineOption moveOption(QStringList() << "move-map", "Move id table (JSON)", "path");
    QCommandLineOption charmapOption(QStringList() << "charmap", "Glyph table (JSON)", "path");
    parser.addOption(speciesOption);
    parser.addOption(itemOption);
    parser.addOption(moveOption);
    parser.addOption(charmapOption);

    QCommandLineOption memberOption(QStringList() << "m" << "member",
        "Party member to edit, 1-based (set)",
        "n",
        "1");
    parser.addOption(memberOption);
    QCommandLineOption evOption(QStringList() << "ev", "Set an EV, e.g. atk=252 (repeatable)", "stat=value");
    QCommandLineOption ivOption(QStringList() << "iv", "Set an IV, e.g. spe=31 (repeatable)", "stat=value");
    QCommandLineOption natureOption(QStringList() << "nature", "Set the nature by name or index", "nature");
    QCommandLineOption heldItemOption(QStringList() << "item", "Set the held item id", "id");
    QCommandLineOption outputOption(QStringList() << "o" << "output", "Where set writes the patched save", "path");
    parser.addOption(evOption);
    parser.addOption(ivOption);
    parser.addOption(natureOption);
    parser.addOption(heldItemOption);
    parser.addOption(outputOption);

    QCommandLineOption ramBaseOption(QStringList() << "ram-base",
        "Bus address of the first byte of the RAM snapshot (live-dump)",
        "address",
        "0x02000000");
    parser.addOption(ramBaseOption);

    parser.process(app);

    // Load .env into process environment (optional). The logging keys it
    // may carry are read by InitAppLogging, so this comes first.
    const auto envVars = GBASave::Common::Dotenv::LoadFile(".env");
    GBASave::Common::Dotenv::ApplyToEnvironment(envVars);

    const std::string logPath = parser.value(logOption).toStdString();
    GBASave::Common::InitAppLogging(QString::fromStdString(logPath));
    Logger::Instance().LogFmt(LogLevel::Info, "main", "Log file: %s", logPath.c_str());
    if (!envVars.empty()) {
        Logger::Instance().LogFmt(LogLevel::Info, "main", "Loaded .env with %zu keys", envVars.size());
    }

    // Command-line options win over the environment.
    auto setting = [&](const QCommandLineOption& option, const char* envKey) {
        if (parser.isSet(option)) return parser.value(option);
        return QString::fromStdString(GBASave::Common::Dotenv::Get(envKey));
    };

    int rc = 1;
    {
        const QStringList args = parser.positionalArguments();
        if (args.size() != 2) {
            Err() << parser.helpText();
            GBASave::Common::ShutdownAppLogging();
            return 1;
        }
        const QString command = args[0];
        const QString path = args[1];

        GBASave::App::TablePaths tablePaths;
        tablePaths.species = setting(speciesOption, "GBASAVE_SPECIES_MAP");
        tablePaths.items = setting(itemOption, "GBASAVE_ITEM_MAP");
        tablePaths.moves = setting(moveOption, "GBASAVE_MOVE_MAP");
        tablePaths.charmap = setting(charmapOption, "GBASAVE_CHARMAP");

        LookupTables tables;
        QString tableError;
        if (!GBASave::App::TableLoader::Load(tablePaths, tables, &tableError)) {
            Err() << "lookup tables: " << tableError << Qt::endl;
            GBASave::Common::ShutdownAppLogging();
            return 1;
        }
        const std::vector<GameProfile> profiles = DefaultProfiles(tables);

        const QString profileName = setting(profileOption, "GBASAVE_PROFILE");
        const QString slotName = setting(slotOption, "GBASAVE_SLOT").toLower();
        ParseOptions options;
        if (slotName == "a") options.slot = SlotPreference::ForceA;
        else if (slotName == "b") options.slot = SlotPreference::ForceB;
        else if (!slotName.isEmpty()) {
            Err() << "unknown slot \"" << slotName << "\" (expected a or b)" << Qt::endl;
            GBASave::Common::ShutdownAppLogging();
            return 1;
        }

        std::vector<uint8_t> bytes;
        if (!ReadFileBytes(path, bytes)) {
            GBASave::Common::ShutdownAppLogging();
            return 1;
        }
        Logger::Instance().LogFmt(LogLevel::Info, "main", "%s %s (%zu bytes)", command.toStdString().c_str(),
                                  path.toStdString().c_str(), bytes.size());

        if (command == "live-dump") {
            const GameProfile* profile = FindProfile(profiles, profileName.isEmpty() ? "emerald" : profileName.toStdString());
            bool okBase = false;
            const uint32_t base = parser.value(ramBaseOption).toUInt(&okBase, 0);
            if (!profile) {
                rc = Fail(SaveStatus::UnsupportedGame, "live-dump " + profileName);
            } else if (!okBase) {
                rc = Fail(SaveStatus::InvalidArgument, "--ram-base " + parser.value(ramBaseOption));
            } else {
                rc = RunLiveDump(bytes, base, *profile);
            }
        } else if (command == "info" || command == "sectors" || command == "set") {
            SaveDocument doc;
            SaveStatus status = LoadSave(bytes, profiles, profileName, options, doc);
            if (status != SaveStatus::Ok) {
                rc = Fail(status, path);
            } else if (command == "info") {
                rc = RunInfo(doc);
            } else if (command == "sectors") {
                rc = RunSectors(doc);
            } else {
                SetRequest req;
                bool okMember = false;
                req.member = parser.value(memberOption).toInt(&okMember);
                req.evs = parser.values(evOption);
                req.ivs = parser.values(ivOption);
                req.nature = parser.value(natureOption);
                req.item = parser.value(heldItemOption);
                req.output = parser.value(outputOption);
                rc = okMember ? RunSet(doc, req) : Fail(SaveStatus::InvalidArgument, "--member");
            }
        } else {
            Err() << "unknown command \"" << command << "\"" << Qt::endl;
            rc = 1;
        }
    }

    GBASave::Common::ShutdownAppLogging();
    return rc;
}
