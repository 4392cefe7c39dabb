#pragma once

// One discrete step of the scripted HORIZONS dialogue. Each phase names
// what the session is waiting for; Done and Failed are terminal.
enum class SessionPhase {
    Connecting,
    AwaitingMainPrompt,
    SubmittingTarget,
    ResolvingAmbiguity,
    SelectingEphemerisType,
    SettingCenter,
    SettingStart,
    SettingStop,
    SettingStep,
    ConfirmingDefaults,
    SettingQuantities,
    AwaitingTable,
    Done,
    Failed,
};

inline const char* to_string(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Connecting:             return "Connecting";
        case SessionPhase::AwaitingMainPrompt:     return "AwaitingMainPrompt";
        case SessionPhase::SubmittingTarget:       return "SubmittingTarget";
        case SessionPhase::ResolvingAmbiguity:     return "ResolvingAmbiguity";
        case SessionPhase::SelectingEphemerisType: return "SelectingEphemerisType";
        case SessionPhase::SettingCenter:          return "SettingCenter";
        case SessionPhase::SettingStart:           return "SettingStart";
        case SessionPhase::SettingStop:            return "SettingStop";
        case SessionPhase::SettingStep:            return "SettingStep";
        case SessionPhase::ConfirmingDefaults:     return "ConfirmingDefaults";
        case SessionPhase::SettingQuantities:      return "SettingQuantities";
        case SessionPhase::AwaitingTable:          return "AwaitingTable";
        case SessionPhase::Done:                   return "Done";
        case SessionPhase::Failed:                 return "Failed";
    }
    return "Unknown";
}
