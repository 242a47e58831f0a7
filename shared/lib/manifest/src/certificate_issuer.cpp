/**
 * @file certificate_issuer.cpp
 * @brief Key pair and certificate production implementation
 */

#include "pkiforge/manifest/certificate_issuer.h"
#include "pkiforge/common/exceptions.h"
#include "pkiforge/utils/file_utils.h"
#include "pkiforge/utils/time_utils.h"
#include "pkiforge/x509/certificate_parser.h"
#include "pkiforge/x509/key_generator.h"
#include "pkiforge/x509/key_usage.h"

#include <spdlog/spdlog.h>

namespace pkiforge::manifest {

ValidityWindow resolveValidity(const CertificateDescriptor& desc,
                               const utils::TimePoint& now) {
    ValidityWindow window;
    window.notBefore = desc.notBefore.value_or(now);

    if (desc.notAfter) {
        window.notAfter = *desc.notAfter;
    } else {
        std::chrono::seconds lifetime = desc.expires.value_or(kDefaultExpiry);
        auto notAfter = utils::addDuration(now, lifetime);
        if (!notAfter) {
            throw common::ManifestException("validity of \"" + desc.subject + "\" (" +
                                            std::to_string(lifetime.count()) +
                                            "s from now) ends after 9999-12-31T23:59:59Z");
        }
        window.notAfter = *notAfter;
    }

    if (window.notAfter <= window.notBefore) {
        throw common::ManifestException("validity of \"" + desc.subject + "\" ends (" +
                                        utils::formatIso8601(window.notAfter) + ") before it starts (" +
                                        utils::formatIso8601(window.notBefore) + ")");
    }
    return window;
}

x509::CertificateTemplate makeTemplate(const CertificateDescriptor& desc,
                                       const utils::TimePoint& now) {
    ValidityWindow window = resolveValidity(desc, now);

    x509::CertificateTemplate tmpl;
    tmpl.subjectDn = desc.subject;
    tmpl.serialNumber = desc.serialNumber ? *desc.serialNumber : x509::generateSerialNumber();
    tmpl.notBefore = window.notBefore;
    tmpl.notAfter = window.notAfter;
    tmpl.isCa = desc.isCa;
    tmpl.keyUsages = desc.keyUsages.value_or(x509::defaultKeyUsages(desc.isCa));
    tmpl.extKeyUsages = desc.extKeyUsages;
    tmpl.subjectAltNames = desc.subjectAltNames;
    tmpl.crlDistributionPoints = desc.crlDistributionPoints;
    return tmpl;
}

KeyMaterial issueCertificate(const CertificateDescriptor& desc,
                             const KeyMaterial* issuer,
                             const utils::TimePoint& now) {
    x509::CertificateTemplate tmpl = makeTemplate(desc, now);

    KeyMaterial material;
    material.key = x509::generateKey(desc.keySpec);

    if (issuer) {
        material.certificate = x509::buildCertificate(tmpl, material.key.get(),
                                                      issuer->certificate.get(), issuer->key.get());
    } else {
        material.certificate = x509::buildCertificate(tmpl, material.key.get());
    }

    spdlog::debug("Issued {} (serial {}, {} {})", desc.subject, tmpl.serialNumber,
                  x509::keyTypeToString(desc.keySpec.type), desc.keySpec.bits);
    return material;
}

std::vector<std::string> writeKeyMaterial(const std::string& destinationDir,
                                          const CertificateDescriptor& desc,
                                          const KeyMaterial& material) {
    std::string certPem = x509::certificateToPem(material.certificate.get());
    std::string keyPem = x509::privateKeyToPem(material.key.get());

    utils::writeFile(utils::joinPath(destinationDir, desc.certificateFile()), certPem, 0644);
    utils::writeFile(utils::joinPath(destinationDir, desc.keyFile()), keyPem, 0600);

    return {desc.certificateFile(), desc.keyFile()};
}

KeyMaterial loadKeyMaterial(const std::string& destinationDir,
                            const CertificateDescriptor& desc) {
    std::string certPath = utils::joinPath(destinationDir, desc.certificateFile());
    std::string keyPath = utils::joinPath(destinationDir, desc.keyFile());

    KeyMaterial material;
    material.certificate = x509::parseCertificateFromPem(utils::readFile(certPath));
    if (!material.certificate) {
        throw common::FilesystemException("cannot parse certificate " + certPath);
    }
    material.key = x509::parsePrivateKeyFromPem(utils::readFile(keyPath));
    if (!material.key) {
        throw common::FilesystemException("cannot parse private key " + keyPath);
    }

    spdlog::debug("Loaded existing key material for {}", desc.filename);
    return material;
}

} // namespace pkiforge::manifest
