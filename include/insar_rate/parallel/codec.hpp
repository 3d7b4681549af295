#pragma once

#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/types.hpp"
#include "insar_rate/parallel/context.hpp"

#include <nlohmann/json.hpp>
#include <cstring>
#include <string>
#include <vector>

namespace insar_rate::parallel {

// Wire encoding of values exchanged between ranks. Specialise encode/decode
// for every type passed through run_once, broadcast_value or the gathers.
template <typename T>
struct Codec;

template <>
struct Codec<nlohmann::json> {
    static Bytes encode(const nlohmann::json& value) {
        return nlohmann::json::to_cbor(value);
    }
    static nlohmann::json decode(const Bytes& bytes) {
        try {
            return nlohmann::json::from_cbor(bytes);
        } catch (const nlohmann::json::exception& e) {
            throw ParallelError(std::string("Malformed message: ") + e.what());
        }
    }
};

template <>
struct Codec<std::string> {
    static Bytes encode(const std::string& value) {
        return Bytes(value.begin(), value.end());
    }
    static std::string decode(const Bytes& bytes) {
        return std::string(bytes.begin(), bytes.end());
    }
};

template <>
struct Codec<Bytes> {
    static Bytes encode(const Bytes& value) { return value; }
    static Bytes decode(const Bytes& bytes) { return bytes; }
};

template <>
struct Codec<std::vector<double>> {
    static Bytes encode(const std::vector<double>& value) {
        Bytes out(value.size() * sizeof(double));
        if (!value.empty()) {
            std::memcpy(out.data(), value.data(), out.size());
        }
        return out;
    }
    static std::vector<double> decode(const Bytes& bytes) {
        if (bytes.size() % sizeof(double) != 0) {
            throw ParallelError("Malformed double vector message");
        }
        std::vector<double> out(bytes.size() / sizeof(double));
        if (!out.empty()) {
            std::memcpy(out.data(), bytes.data(), bytes.size());
        }
        return out;
    }
};

// rows and cols as int64 followed by the row-major values
template <>
struct Codec<Matrix2Dd> {
    static Bytes encode(const Matrix2Dd& value) {
        const int64_t dims[2] = {static_cast<int64_t>(value.rows()),
                                 static_cast<int64_t>(value.cols())};
        Bytes out(sizeof(dims) + static_cast<size_t>(value.size()) * sizeof(double));
        std::memcpy(out.data(), dims, sizeof(dims));
        if (value.size() > 0) {
            std::memcpy(out.data() + sizeof(dims), value.data(),
                        static_cast<size_t>(value.size()) * sizeof(double));
        }
        return out;
    }
    static Matrix2Dd decode(const Bytes& bytes) {
        int64_t dims[2] = {0, 0};
        if (bytes.size() < sizeof(dims)) {
            throw ParallelError("Malformed matrix message");
        }
        std::memcpy(dims, bytes.data(), sizeof(dims));
        const size_t payload = bytes.size() - sizeof(dims);
        if (dims[0] < 0 || dims[1] < 0 ||
            payload != static_cast<size_t>(dims[0] * dims[1]) * sizeof(double)) {
            throw ParallelError("Malformed matrix message");
        }
        Matrix2Dd out(dims[0], dims[1]);
        if (out.size() > 0) {
            std::memcpy(out.data(), bytes.data() + sizeof(dims), payload);
        }
        return out;
    }
};

template <>
struct Codec<std::vector<Tile>> {
    static Bytes encode(const std::vector<Tile>& tiles) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& t : tiles) {
            arr.push_back({t.index, t.row_start, t.row_end, t.col_start, t.col_end});
        }
        return Codec<nlohmann::json>::encode(arr);
    }
    static std::vector<Tile> decode(const Bytes& bytes) {
        const nlohmann::json arr = Codec<nlohmann::json>::decode(bytes);
        std::vector<Tile> tiles;
        for (const auto& t : arr) {
            if (!t.is_array() || t.size() != 5) {
                throw ParallelError("Malformed tile message");
            }
            tiles.push_back(Tile{t[0].get<int>(), t[1].get<int>(), t[2].get<int>(),
                                 t[3].get<int>(), t[4].get<int>()});
        }
        return tiles;
    }
};

template <>
struct Codec<PixelCoord> {
    static Bytes encode(const PixelCoord& p) {
        const int32_t xy[2] = {p.x, p.y};
        Bytes out(sizeof(xy));
        std::memcpy(out.data(), xy, sizeof(xy));
        return out;
    }
    static PixelCoord decode(const Bytes& bytes) {
        int32_t xy[2] = {0, 0};
        if (bytes.size() != sizeof(xy)) {
            throw ParallelError("Malformed pixel message");
        }
        std::memcpy(xy, bytes.data(), sizeof(xy));
        return PixelCoord{xy[0], xy[1]};
    }
};

template <typename T>
Bytes encode(const T& value) {
    return Codec<T>::encode(value);
}

template <typename T>
T decode(const Bytes& bytes) {
    return Codec<T>::decode(bytes);
}

} // namespace insar_rate::parallel
