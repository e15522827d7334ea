#include "core/SessionJson.h"
#include "core/Logger.h"

#include <juce_core/juce_core.h>

namespace deckmix {

// ═══════════════════════════════════════════════════════════════════
// Field readers
// ═══════════════════════════════════════════════════════════════════
// Absent or null fields leave `out` untouched and succeed.

static bool isUnset(const juce::DynamicObject& obj, const char* key)
{
    return !obj.hasProperty(key) || obj.getProperty(key).isVoid();
}

static bool readNumber(const juce::DynamicObject& obj, const char* key,
                       double& out, std::string& error)
{
    if (isUnset(obj, key)) return true;
    const juce::var& v = obj.getProperty(key);
    if (!v.isDouble() && !v.isInt() && !v.isInt64())
    {
        error = std::string("'") + key + "' must be a number";
        return false;
    }
    out = static_cast<double>(v);
    return true;
}

static bool readFloat(const juce::DynamicObject& obj, const char* key,
                      float& out, std::string& error)
{
    double d = out;
    if (!readNumber(obj, key, d, error)) return false;
    out = static_cast<float>(d);
    return true;
}

static bool readInt(const juce::DynamicObject& obj, const char* key,
                    int& out, std::string& error)
{
    if (isUnset(obj, key)) return true;
    const juce::var& v = obj.getProperty(key);
    if (!v.isInt() && !v.isInt64())
    {
        error = std::string("'") + key + "' must be an integer";
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

static bool readBool(const juce::DynamicObject& obj, const char* key,
                     bool& out, std::string& error)
{
    if (isUnset(obj, key)) return true;
    const juce::var& v = obj.getProperty(key);
    if (!v.isBool())
    {
        error = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = static_cast<bool>(v);
    return true;
}

static bool readString(const juce::DynamicObject& obj, const char* key,
                       std::string& out, std::string& error)
{
    if (isUnset(obj, key)) return true;
    const juce::var& v = obj.getProperty(key);
    if (!v.isString())
    {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = v.toString().toStdString();
    return true;
}

static juce::DynamicObject* requireObject(const juce::var& v, const std::string& what,
                                          std::string& error)
{
    auto* obj = v.getDynamicObject();
    if (!obj)
        error = what + " must be an object";
    return obj;
}

static const juce::Array<juce::var>* readArray(const juce::DynamicObject& obj, const char* key,
                                               bool& ok, std::string& error)
{
    ok = true;
    if (isUnset(obj, key)) return nullptr;
    const juce::var& v = obj.getProperty(key);
    if (!v.isArray())
    {
        error = std::string("'") + key + "' must be an array";
        ok = false;
        return nullptr;
    }
    return v.getArray();
}

static bool parseRoot(const std::string& json, juce::var& root, std::string& error)
{
    auto result = juce::JSON::parse(juce::String(json), root);
    if (result.failed())
    {
        error = "JSON parse error: " + result.getErrorMessage().toStdString();
        return false;
    }
    if (!root.getDynamicObject())
    {
        error = "top-level JSON value must be an object";
        return false;
    }
    return true;
}

static std::string dump(const juce::DynamicObject::Ptr& root)
{
    return juce::JSON::toString(juce::var(root.get()), true).toStdString();
}

// ═══════════════════════════════════════════════════════════════════
// Ducking / track gains
// ═══════════════════════════════════════════════════════════════════

static bool readDucking(const juce::DynamicObject& obj, DuckingParams& out, std::string& error)
{
    return readBool(obj, "enabled", out.enabled, error)
        && readFloat(obj, "amountDb", out.amountDb, error)
        && readFloat(obj, "attackMs", out.attackMs, error)
        && readFloat(obj, "releaseMs", out.releaseMs, error);
}

static juce::var duckingToVar(const DuckingParams& d)
{
    juce::DynamicObject::Ptr obj = new juce::DynamicObject();
    obj->setProperty("enabled", d.enabled);
    obj->setProperty("amountDb", static_cast<double>(d.amountDb));
    obj->setProperty("attackMs", static_cast<double>(d.attackMs));
    obj->setProperty("releaseMs", static_cast<double>(d.releaseMs));
    return juce::var(obj.get());
}

static bool readTrackGains(const juce::DynamicObject& root, TrackGains& out, std::string& error)
{
    if (isUnset(root, "trackGains")) return true;
    auto* obj = requireObject(root.getProperty("trackGains"), "'trackGains'", error);
    if (!obj) return false;
    return readFloat(*obj, "clip", out.clip, error)
        && readFloat(*obj, "bed", out.bed, error)
        && readFloat(*obj, "sfx", out.sfx, error);
}

static juce::var optionalNumber(const std::optional<double>& v)
{
    return v ? juce::var(*v) : juce::var();
}

static bool readOptional(const juce::DynamicObject& obj, const char* key,
                         std::optional<double>& out, std::string& error)
{
    if (isUnset(obj, key))
    {
        out.reset();
        return true;
    }
    double d = 0.0;
    if (!readNumber(obj, key, d, error)) return false;
    out = d;
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// EngineConfig
// ═══════════════════════════════════════════════════════════════════

static bool readTrigger(const juce::var& v, size_t index, Trigger& t, std::string& error)
{
    std::string where = "triggers[" + std::to_string(index) + "]";
    auto* obj = requireObject(v, where, error);
    if (!obj) return false;

    bool ok = readString(*obj, "id", t.id, error)
           && readString(*obj, "uri", t.uri, error)
           && readInt(*obj, "deck", t.deck, error)
           && readNumber(*obj, "atMs", t.atMs, error)
           && readNumber(*obj, "durationMs", t.durationMs, error)
           && readFloat(*obj, "gain", t.gain, error);
    if (!ok)
        error = where + ": " + error;
    return ok;
}

static bool readDeckSettings(const juce::var& v, size_t index, EngineConfig& config,
                             std::string& error)
{
    std::string where = "decks[" + std::to_string(index) + "]";
    auto* obj = requireObject(v, where, error);
    if (!obj) return false;

    int deck = 0;
    if (!readInt(*obj, "deck", deck, error))
    {
        error = where + ": " + error;
        return false;
    }
    if (!isValidDeck(deck))
    {
        error = where + ": deck must be 1.." + std::to_string(kNumDecks);
        return false;
    }

    bool muted = config.deckMutes[deck - 1];
    bool solo = config.deckSolos[deck - 1];
    bool ok = readFloat(*obj, "gain", config.deckGains[deck - 1], error)
           && readBool(*obj, "muted", muted, error)
           && readBool(*obj, "solo", solo, error);
    if (!ok)
    {
        error = where + ": " + error;
        return false;
    }
    config.deckMutes[deck - 1] = muted;
    config.deckSolos[deck - 1] = solo;
    return true;
}

bool parseEngineConfig(const std::string& json, EngineConfig& out, std::string& error)
{
    juce::var root;
    if (!parseRoot(json, root, error))
        return false;
    auto& obj = *root.getDynamicObject();

    EngineConfig config;
    if (isUnset(obj, "mainUri"))
    {
        error = "'mainUri' is required";
        return false;
    }
    if (!readString(obj, "mainUri", config.mainUri, error)
        || !readFloat(obj, "mainGain", config.mainGain, error)
        || !readBool(obj, "mainMuted", config.mainMuted, error)
        || !readBool(obj, "mainSolo", config.mainSolo, error))
        return false;

    bool ok;
    if (auto* decks = readArray(obj, "decks", ok, error))
    {
        for (int i = 0; i < decks->size(); ++i)
            if (!readDeckSettings(decks->getReference(i), static_cast<size_t>(i), config, error))
                return false;
    }
    if (!ok) return false;

    if (auto* triggers = readArray(obj, "triggers", ok, error))
    {
        for (int i = 0; i < triggers->size(); ++i)
        {
            Trigger t;
            if (!readTrigger(triggers->getReference(i), static_cast<size_t>(i), t, error))
                return false;
            config.triggers.push_back(std::move(t));
        }
    }
    if (!ok) return false;

    if (!isUnset(obj, "ducking"))
    {
        auto* d = requireObject(obj.getProperty("ducking"), "'ducking'", error);
        if (!d || !readDucking(*d, config.ducking, error))
            return false;
        config.hasDucking = true;
    }

    DM_DEBUG("parseEngineConfig: main=%s triggers=%d ducking=%d",
             config.mainUri.c_str(), static_cast<int>(config.triggers.size()),
             config.hasDucking);
    out = std::move(config);
    return true;
}

std::string engineConfigToJson(const EngineConfig& config)
{
    juce::DynamicObject::Ptr root = new juce::DynamicObject();
    root->setProperty("mainUri", juce::String(config.mainUri));
    root->setProperty("mainGain", static_cast<double>(config.mainGain));
    root->setProperty("mainMuted", config.mainMuted);
    root->setProperty("mainSolo", config.mainSolo);

    juce::Array<juce::var> decks;
    for (int deck = 1; deck <= kNumDecks; ++deck)
    {
        juce::DynamicObject::Ptr d = new juce::DynamicObject();
        d->setProperty("deck", deck);
        d->setProperty("gain", static_cast<double>(config.deckGain(deck)));
        d->setProperty("muted", config.deckMuted(deck));
        d->setProperty("solo", config.deckSoloed(deck));
        decks.add(juce::var(d.get()));
    }
    root->setProperty("decks", decks);

    juce::Array<juce::var> triggers;
    for (const auto& t : config.triggers)
    {
        juce::DynamicObject::Ptr o = new juce::DynamicObject();
        o->setProperty("id", juce::String(t.id));
        o->setProperty("uri", juce::String(t.uri));
        o->setProperty("deck", t.deck);
        o->setProperty("atMs", t.atMs);
        o->setProperty("durationMs", t.durationMs);
        o->setProperty("gain", static_cast<double>(t.gain));
        triggers.add(juce::var(o.get()));
    }
    root->setProperty("triggers", triggers);

    root->setProperty("ducking", config.hasDucking ? duckingToVar(config.ducking) : juce::var());
    return dump(root);
}

bool parseDuckingParams(const std::string& json, DuckingParams& out, std::string& error)
{
    juce::var root;
    if (!parseRoot(json, root, error))
        return false;
    DuckingParams params;
    if (!readDucking(*root.getDynamicObject(), params, error))
        return false;
    out = params;
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Editor plan
// ═══════════════════════════════════════════════════════════════════

bool parseEditorPlan(const std::string& json, EditorPlan& out, std::string& error)
{
    juce::var root;
    if (!parseRoot(json, root, error))
        return false;
    auto& obj = *root.getDynamicObject();

    EditorPlan plan;
    if (!readString(obj, "baseUri", plan.baseUri, error)
        || !readTrackGains(obj, plan.trackGains, error))
        return false;

    bool ok;
    if (auto* segments = readArray(obj, "segments", ok, error))
    {
        for (int i = 0; i < segments->size(); ++i)
        {
            std::string where = "segments[" + std::to_string(i) + "]";
            auto* s = requireObject(segments->getReference(i), where, error);
            if (!s) return false;

            EditorSegment seg;
            if (!readString(*s, "id", seg.id, error)
                || !readString(*s, "uri", seg.uri, error)
                || !readNumber(*s, "startMs", seg.startMs, error)
                || !readNumber(*s, "endMs", seg.endMs, error)
                || !readString(*s, "track", seg.track, error))
            {
                error = where + ": " + error;
                return false;
            }
            plan.segments.push_back(std::move(seg));
        }
    }
    if (!ok) return false;

    if (!isUnset(obj, "ducking"))
    {
        auto* d = requireObject(obj.getProperty("ducking"), "'ducking'", error);
        if (!d || !readDucking(*d, plan.ducking, error))
            return false;
        plan.hasDucking = true;
    }

    out = std::move(plan);
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// MixdownPlan
// ═══════════════════════════════════════════════════════════════════

std::string mixdownPlanToJson(const MixdownPlan& plan)
{
    juce::DynamicObject::Ptr root = new juce::DynamicObject();
    root->setProperty("baseUri", juce::String(plan.baseUri));

    juce::Array<juce::var> segments;
    for (const auto& s : plan.segments)
    {
        juce::DynamicObject::Ptr o = new juce::DynamicObject();
        o->setProperty("uri", juce::String(s.uri));
        o->setProperty("startMs", s.startMs);
        o->setProperty("endMs", s.endMs);
        o->setProperty("trackId", juce::String(s.trackId));
        o->setProperty("gain", static_cast<double>(s.gain));
        o->setProperty("pan", static_cast<double>(s.pan));
        o->setProperty("fadeInMs", s.fadeInMs);
        o->setProperty("fadeOutMs", s.fadeOutMs);
        segments.add(juce::var(o.get()));
    }
    root->setProperty("segments", segments);

    juce::DynamicObject::Ptr gains = new juce::DynamicObject();
    gains->setProperty("clip", static_cast<double>(plan.trackGains.clip));
    gains->setProperty("bed", static_cast<double>(plan.trackGains.bed));
    gains->setProperty("sfx", static_cast<double>(plan.trackGains.sfx));
    root->setProperty("trackGains", juce::var(gains.get()));

    root->setProperty("ducking", duckingToVar(plan.ducking));

    juce::DynamicObject::Ptr fx = new juce::DynamicObject();
    fx->setProperty("normalizeGainDb", optionalNumber(plan.fx.normalizeGainDb));
    fx->setProperty("fadeInMs", optionalNumber(plan.fx.fadeInMs));
    fx->setProperty("fadeOutMs", optionalNumber(plan.fx.fadeOutMs));
    root->setProperty("fx", juce::var(fx.get()));

    root->setProperty("outExt", juce::String(plan.outExt));
    return dump(root);
}

bool parseMixdownPlan(const std::string& json, MixdownPlan& out, std::string& error)
{
    juce::var root;
    if (!parseRoot(json, root, error))
        return false;
    auto& obj = *root.getDynamicObject();

    MixdownPlan plan;
    if (!readString(obj, "baseUri", plan.baseUri, error)
        || !readTrackGains(obj, plan.trackGains, error)
        || !readString(obj, "outExt", plan.outExt, error))
        return false;

    if (!isValidOutExt(plan.outExt))
    {
        error = "'outExt' must be m4a, wav or mp3";
        return false;
    }

    bool ok;
    if (auto* segments = readArray(obj, "segments", ok, error))
    {
        for (int i = 0; i < segments->size(); ++i)
        {
            std::string where = "segments[" + std::to_string(i) + "]";
            auto* s = requireObject(segments->getReference(i), where, error);
            if (!s) return false;

            MixdownSegment seg;
            if (!readString(*s, "uri", seg.uri, error)
                || !readNumber(*s, "startMs", seg.startMs, error)
                || !readNumber(*s, "endMs", seg.endMs, error)
                || !readString(*s, "trackId", seg.trackId, error)
                || !readFloat(*s, "gain", seg.gain, error)
                || !readFloat(*s, "pan", seg.pan, error)
                || !readNumber(*s, "fadeInMs", seg.fadeInMs, error)
                || !readNumber(*s, "fadeOutMs", seg.fadeOutMs, error))
            {
                error = where + ": " + error;
                return false;
            }
            plan.segments.push_back(std::move(seg));
        }
    }
    if (!ok) return false;

    if (!isUnset(obj, "ducking"))
    {
        auto* d = requireObject(obj.getProperty("ducking"), "'ducking'", error);
        if (!d || !readDucking(*d, plan.ducking, error))
            return false;
    }

    if (!isUnset(obj, "fx"))
    {
        auto* fx = requireObject(obj.getProperty("fx"), "'fx'", error);
        if (!fx
            || !readOptional(*fx, "normalizeGainDb", plan.fx.normalizeGainDb, error)
            || !readOptional(*fx, "fadeInMs", plan.fx.fadeInMs, error)
            || !readOptional(*fx, "fadeOutMs", plan.fx.fadeOutMs, error))
            return false;
    }

    out = std::move(plan);
    return true;
}

} // namespace deckmix
