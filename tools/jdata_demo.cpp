#include "jdata/jdata.hpp"
#include "jdata/jdata_easy.hpp"

#include <cstdint>
#include <iostream>
#include <vector>

int main() {
    try {
        using namespace jdata;

        Record root;

        // 2x3 double matrix, row-major: [ [1 2 3]; [4 5 6] ]
        easy::set(root, "A", Value::make_array(easy::make_array<double>({2, 3}, {1, 2, 3, 4, 5, 6})));

        // 1x4 single vector
        easy::set(root, "B", Value::make_array(easy::make_array<float>({1, 4}, {0.1f, 0.2f, 0.3f, 0.4f})));

        // 3x3x4 int32 volume
        std::vector<std::int32_t> dataC(3 * 3 * 4);
        for (std::size_t i = 0; i < dataC.size(); ++i) dataC[i] = static_cast<std::int32_t>(i);
        easy::set(root, "C", Value::make_array(easy::make_array({3, 3, 4}, dataC)));

        // 5x5 lower-triangular matrix, stored packed
        std::vector<double> lower(25, 0.0);
        for (std::size_t r = 0; r < 5; ++r) {
            for (std::size_t c = 0; c <= r; ++c) lower[r * 5 + c] = static_cast<double>(r * 5 + c + 1);
        }
        easy::set(root, "L", Value::make_array(easy::make_array<double>({5, 5}, lower)));

        // Complex row and a small sparse matrix
        easy::set(root, "z", Value::make_complex(easy::make_complex({1, 3}, {1, 2, 3}, {-1, 0, 0.5})));
        SparseMatrix s;
        s.rows = 4;
        s.cols = 4;
        s.entries = {{0, 0, 2.0, 0}, {3, 1, -1.0, 0}};
        easy::set(root, "S", Value::make_sparse(s));

        easy::set(root, "msg", Value::make_text("hello"));

        WriteOptions wo;
        wo.compression = Codec::Zlib;
        wo.use_array_shape = true;
        wo.keep_type = true;

        const Value doc = Value::make_record(root);
        for (const char* file : {"demo_out.json", "demo_out.bjd"}) {
            save_file(file, doc, wo);
            std::cout << "Wrote: " << file << "\n";

            PositionIndex index;
            Value back = load_file(file, ReadOptions{}, &index);
            if (back != doc) {
                std::cerr << "round trip mismatch in " << file << "\n";
                return 1;
            }

            const NDArray& a = back.as_record().at("A").as_array();
            std::cout << "Read A: type=" << to_string(a.type)
                      << " shape=[" << a.shape[0] << " x " << a.shape[1] << "]"
                      << " bytes=" << a.data.size() << "\n";
            if (const IndexEntry* e = find_entry(index, "$.L")) {
                std::cout << "L at offset " << e->span.offset << ", " << e->span.length << " bytes\n";
            }
        }

        std::cout << "OK\n";
        return 0;

    } catch (const jdata::JdataError& e) {
        std::cerr << "JData error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
