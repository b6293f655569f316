/**
 * Execution path implementations
 */

#include "execution_path.hpp"

#include "../core/errors.hpp"
#include "sample_inputs.hpp"

#include <array>
#include <cstring>

namespace conhal {

namespace {

/**
 * Shared base: owns the backend's kernels.
 */
class KernelPath : public ExecutionPath {
public:
    explicit KernelPath(Backend backend)
        : backend_(backend), kernels_(descriptor(backend)) {}

    Backend backend() const override { return backend_; }

protected:
    Backend backend_;
    BackendKernels kernels_;
};

class SignaturePath : public KernelPath {
public:
    using KernelPath::KernelPath;

    Operation operation() const override { return Operation::SignatureVerification; }

    ExecutionOutput execute(ByteView input) const override {
        ExecutionOutput out;
        if (input.size() != SIGNATURE_INPUT_SIZE) {
            out.verdict = Verdict::Malformed;
            return out;
        }
        bool ok = kernels_.verifier.verify(input.subspan(0, 32),
                                           input.subspan(32, 32),
                                           input.subspan(64, 64));
        out.verdict = ok ? Verdict::Valid : Verdict::Invalid;
        return out;
    }
};

class ScriptPath : public KernelPath {
public:
    using KernelPath::KernelPath;

    Operation operation() const override { return Operation::ScriptExecution; }

    ExecutionOutput execute(ByteView input) const override {
        ExecutionOutput out;
        auto req = script::decode_request(input);
        if (!req) {
            out.verdict = Verdict::Malformed;
            return out;
        }
        script::ScriptError err = kernels_.interpreter.run(*req);
        out.verdict = err == script::ScriptError::Ok ? Verdict::Valid : Verdict::Invalid;
        out.data.push_back(static_cast<uint8_t>(err));
        return out;
    }
};

class DoubleShaPath : public KernelPath {
public:
    using KernelPath::KernelPath;

    Operation operation() const override { return Operation::DoubleSha256; }

    ExecutionOutput execute(ByteView input) const override {
        Hash256 digest = kernels_.hash.hash256(input);
        ExecutionOutput out;
        out.verdict = Verdict::Valid;
        out.data.assign(digest.begin(), digest.end());
        return out;
    }
};

class MerklePath : public KernelPath {
public:
    using KernelPath::KernelPath;

    Operation operation() const override { return Operation::MerkleRoot; }

    ExecutionOutput execute(ByteView input) const override {
        ExecutionOutput out;
        if (input.empty() || input.size() % 32 != 0) {
            out.verdict = Verdict::Malformed;
            return out;
        }
        std::vector<Hash256> leaves(input.size() / 32);
        for (size_t i = 0; i < leaves.size(); i++) {
            std::memcpy(leaves[i].data(), input.data() + 32 * i, 32);
        }
        Hash256 root = crypto::merkle_root(kernels_.hash, std::move(leaves));
        out.verdict = Verdict::Valid;
        out.data.assign(root.begin(), root.end());
        return out;
    }
};

class BatchPath : public KernelPath {
public:
    using KernelPath::KernelPath;

    Operation operation() const override { return Operation::BatchVerification; }

    ExecutionOutput execute(ByteView input) const override {
        ExecutionOutput out;
        if (input.empty() || input.size() % SIGNATURE_INPUT_SIZE != 0) {
            out.verdict = Verdict::Malformed;
            return out;
        }

        const size_t count = input.size() / SIGNATURE_INPUT_SIZE;
        std::vector<crypto::SchnorrBatchItem> items(count);
        for (size_t i = 0; i < count; i++) {
            ByteView item = input.subspan(i * SIGNATURE_INPUT_SIZE, SIGNATURE_INPUT_SIZE);
            items[i] = {item.subspan(0, 32), item.subspan(32, 32), item.subspan(64, 64)};
        }

        std::vector<bool> ok = kernels_.verifier.verify_batch(items);
        out.verdict = Verdict::Valid;
        out.data.reserve(count);
        for (size_t i = 0; i < count; i++) {
            Verdict v = ok[i] ? Verdict::Valid : Verdict::Invalid;
            if (!ok[i]) out.verdict = Verdict::Invalid;
            out.data.push_back(static_cast<uint8_t>(v));
        }
        return out;
    }
};

// Built once; signing the samples is not free
const Bytes& cached_sample(Operation op) {
    static const std::array<Bytes, ALL_OPERATIONS.size()> samples = [] {
        std::array<Bytes, ALL_OPERATIONS.size()> s;
        for (Operation o : ALL_OPERATIONS) s[static_cast<size_t>(o)] = sample_input(o);
        return s;
    }();
    return samples[static_cast<size_t>(op)];
}

/**
 * The sample is valid for every operation. Hash outputs are compared with
 * a scalar Reference engine.
 */
bool passes_self_test(const ExecutionPath& path) {
    const Bytes& input = cached_sample(path.operation());
    ExecutionOutput out = path.execute(as_view(input));
    if (out.verdict != Verdict::Valid) return false;

    crypto::HashEngine reference;
    switch (path.operation()) {
        case Operation::SignatureVerification:
            return out.data.empty();
        case Operation::ScriptExecution:
            return out.data == Bytes{static_cast<uint8_t>(script::ScriptError::Ok)};
        case Operation::DoubleSha256: {
            Hash256 expected = reference.hash256(as_view(input));
            return out.data == Bytes(expected.begin(), expected.end());
        }
        case Operation::MerkleRoot: {
            std::vector<Hash256> leaves(input.size() / 32);
            for (size_t i = 0; i < leaves.size(); i++) {
                std::memcpy(leaves[i].data(), input.data() + 32 * i, 32);
            }
            Hash256 expected = crypto::merkle_root(reference, std::move(leaves));
            return out.data == Bytes(expected.begin(), expected.end());
        }
        case Operation::BatchVerification:
            return out.data.size() == input.size() / SIGNATURE_INPUT_SIZE;
    }
    return false;
}

PathHandle build_path(Operation op, Backend backend) {
    switch (op) {
        case Operation::SignatureVerification: return std::make_shared<SignaturePath>(backend);
        case Operation::ScriptExecution:       return std::make_shared<ScriptPath>(backend);
        case Operation::DoubleSha256:          return std::make_shared<DoubleShaPath>(backend);
        case Operation::MerkleRoot:            return std::make_shared<MerklePath>(backend);
        case Operation::BatchVerification:     return std::make_shared<BatchPath>(backend);
    }
    throw BackendUnavailable(std::string("no path for operation ") + to_string(op));
}

}  // namespace

PathHandle make_path(Operation op, Backend backend) {
    PathHandle path = build_path(op, backend);
    if (!passes_self_test(*path)) {
        throw BackendUnavailable(std::string(to_string(backend)) + " failed the " + to_string(op) +
                                 " self-test");
    }
    return path;
}

Bytes encode_signature_input(ByteView msg, ByteView pubkey, ByteView sig) {
    Bytes out;
    out.reserve(msg.size() + pubkey.size() + sig.size());
    append(out, msg);
    append(out, pubkey);
    append(out, sig);
    return out;
}

Bytes encode_merkle_input(const std::vector<Hash256>& leaves) {
    Bytes out;
    out.reserve(leaves.size() * 32);
    for (const auto& leaf : leaves) append(out, as_view(leaf));
    return out;
}

Bytes encode_batch_input(const std::vector<Bytes>& signature_inputs) {
    Bytes out;
    out.reserve(signature_inputs.size() * SIGNATURE_INPUT_SIZE);
    for (const auto& item : signature_inputs) append(out, as_view(item));
    return out;
}

std::vector<Verdict> batch_verdicts(const ExecutionOutput& out) {
    std::vector<Verdict> verdicts;
    if (out.verdict == Verdict::Malformed) return verdicts;
    verdicts.reserve(out.data.size());
    for (uint8_t b : out.data) {
        verdicts.push_back(b == static_cast<uint8_t>(Verdict::Valid) ? Verdict::Valid : Verdict::Invalid);
    }
    return verdicts;
}

std::optional<script::ScriptError> script_error(const ExecutionOutput& out) {
    if (out.verdict == Verdict::Malformed || out.data.size() != 1) return std::nullopt;
    if (out.data[0] > static_cast<uint8_t>(script::ScriptError::CleanStack)) return std::nullopt;
    return static_cast<script::ScriptError>(out.data[0]);
}

}  // namespace conhal
