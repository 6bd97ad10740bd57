#pragma once
/*
 * Fingerprinter
 *
 * Purpose: reduce content to a comparable key so unchanged input skips re-wrapping.
 * Design: interface with a hashing default (FNV-1a, hex) and an identity
 *         strategy that keeps the text itself (exact, useful in tests).
 */
#include <memory>
#include <string>
#include <string_view>

class IFingerprinter {
public:
  virtual ~IFingerprinter() = default;
  virtual std::string fingerprint(std::string_view content) const = 0;
};

class HashFingerprinter : public IFingerprinter {
public:
  std::string fingerprint(std::string_view content) const override;
};

class IdentityFingerprinter : public IFingerprinter {
public:
  std::string fingerprint(std::string_view content) const override { return std::string(content); }
};

std::shared_ptr<const IFingerprinter> default_fingerprinter();
