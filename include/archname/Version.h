#ifndef ARCHNAME_VERSION_H
#define ARCHNAME_VERSION_H

#define ARCHNAME_NAME        "archname"
#define ARCHNAME_FULL_NAME   "Archive Filename Synthesizer"
#define ARCHNAME_VERSION     "1.0.0"
#define ARCHNAME_VERSION_MAJOR 1
#define ARCHNAME_VERSION_MINOR 0
#define ARCHNAME_VERSION_PATCH 0

namespace arn {

constexpr const char* getVersionString() {
    return ARCHNAME_VERSION;
}

constexpr int getVersionMajor() {
    return ARCHNAME_VERSION_MAJOR;
}

constexpr int getVersionMinor() {
    return ARCHNAME_VERSION_MINOR;
}

constexpr int getVersionPatch() {
    return ARCHNAME_VERSION_PATCH;
}

} // namespace arn

#endif // ARCHNAME_VERSION_H
