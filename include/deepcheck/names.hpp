// Member name normalization: recover the source-level name of compiler-synthesized members.
#pragma once
#include <string>
#include <string_view>

namespace deepcheck {

enum class MemberOrigin {
    Ordinary,            // hand-declared field
    SynthesizedAccessor, // backing field of an auto-property: <Name>k__BackingField
    SynthesizedCapture   // field of an anonymous type / closure: <Name>i__Field
};

struct NormalizedName { std::string semantic; MemberOrigin origin = MemberOrigin::Ordinary; };

// Strategy interface so ports that never synthesize names can plug a no-op.
class NameRecognizer {
public:
    virtual ~NameRecognizer() = default;
    // Pure: same input, same output.
    virtual NormalizedName normalize(std::string_view raw) const = 0;
};

// Recognizes the two wrapper patterns (PEGTL grammar, whole-string, strict).
class SynthesizedNameRecognizer final : public NameRecognizer {
public:
    NormalizedName normalize(std::string_view raw) const override;
};

// Every name is Ordinary and kept as-is.
class PlainNameRecognizer final : public NameRecognizer {
public:
    NormalizedName normalize(std::string_view raw) const override { return NormalizedName{std::string(raw), MemberOrigin::Ordinary}; }
};

// Stateless shared instances.
const NameRecognizer& synthesized_recognizer();
const NameRecognizer& plain_recognizer();
// "plain" -> plain_recognizer(), anything else -> synthesized_recognizer().
const NameRecognizer& recognizer_named(std::string_view name);

inline NormalizedName normalize(std::string_view raw){ return synthesized_recognizer().normalize(raw); }

const char* origin_name(MemberOrigin o);

// Capture-style raw name for a field of an anonymous record.
inline std::string capture_name(std::string_view semantic){ return "<" + std::string(semantic) + ">i__Field"; }

} // namespace deepcheck
