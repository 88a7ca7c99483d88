#include "jdata/jdata.hpp"
#include "jdata/jdata_easy.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

static double ms_since(const std::chrono::high_resolution_clock::time_point& t0) {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(high_resolution_clock::now() - t0).count();
}

static jdata::Value make_payload(std::size_t rows, std::size_t cols) {
    jdata::Record root;

    // Large double matrix
    {
        std::vector<double> v(rows * cols);
        std::mt19937_64 rng(123);
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        for (auto& x : v) x = dist(rng);
        root.set("A_double", jdata::Value::make_array(jdata::easy::make_array({rows, cols}, v)));
    }

    // Large single matrix
    {
        std::vector<float> v(rows * cols);
        std::mt19937 rng(456);
        std::uniform_real_distribution<float> dist(0.0f, 1.0f);
        for (auto& x : v) x = dist(rng);
        root.set("A_single", jdata::Value::make_array(jdata::easy::make_array({rows, cols}, v)));
    }

    // Small-range integers compress well
    {
        std::vector<std::int16_t> v(rows * cols);
        for (std::size_t i = 0; i < v.size(); ++i) v[i] = static_cast<std::int16_t>(i % 97);
        root.set("A_int16", jdata::Value::make_array(jdata::easy::make_array({rows, cols}, v)));
    }

    return jdata::Value::make_record(root);
}

static void bench_one(const std::filesystem::path& file, const jdata::Value& root, jdata::Codec codec) {
    jdata::WriteOptions wo;
    wo.compression = codec;
    wo.compression_level = 6;

    std::cout << "=== " << file.extension().string() << " compression=" << jdata::to_string(codec) << " ===\n";

    auto t0 = std::chrono::high_resolution_clock::now();
    jdata::save_file(file, root, wo);
    double w_ms = ms_since(t0);

    std::uintmax_t sz = std::filesystem::file_size(file);
    double mb = static_cast<double>(sz) / (1024.0 * 1024.0);

    std::cout << "write: " << w_ms << " ms, file=" << mb << " MiB, throughput=" << (mb / (w_ms / 1000.0)) << " MiB/s\n";

    t0 = std::chrono::high_resolution_clock::now();
    jdata::Value read = jdata::load_file(file);
    double r_ms = ms_since(t0);
    std::cout << "read : " << r_ms << " ms, throughput=" << (mb / (r_ms / 1000.0)) << " MiB/s\n";
    if (read != root) std::cout << "read : MISMATCH\n";
}

int main(int argc, char** argv) {
    std::filesystem::path dir = (argc >= 2) ? argv[1] : std::filesystem::temp_directory_path();
    std::size_t n = (argc >= 3) ? static_cast<std::size_t>(std::stoull(argv[2])) : 600;
    try {
        const jdata::Value root = make_payload(n, n);
        for (const char* name : {"jdata_cpp_bench.bjd", "jdata_cpp_bench.json"}) {
            const std::filesystem::path file = dir / name;
            bench_one(file, root, jdata::Codec::None);
            bench_one(file, root, jdata::Codec::Zlib);
            bench_one(file, root, jdata::Codec::Gzip);
            bench_one(file, root, jdata::Codec::Lzma);
            std::filesystem::remove(file);
        }
    } catch (const std::exception& e) {
        std::cerr << "bench error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
