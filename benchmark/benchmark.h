#ifndef BENCHMARK_H
#define BENCHMARK_H

#include <stdio.h>
#include <time.h>
#include <string>
#include <vector>

class timer
{
public:
    timer() : start_(0) { }
    timer(const timer &) = delete;
    void operator = (const timer &) = delete;

    void start()
    {
        start_ = clock();
    }

    double elapsed_milliseconds() const
    {
        return static_cast<double>(clock() - start_)
            / CLOCKS_PER_SEC * 1000;
    }

private:
    clock_t start_;
};

class benchmark_base
{
public:
    benchmark_base(const std::string &name,
                   const std::string &desc,
                   int iterations)
        : name_(name), desc_(desc), iterations_(iterations), matched_(0)
    {
    }

    benchmark_base(const benchmark_base &) = delete;
    void operator = (const benchmark_base &) = delete;

    const std::string& get_desc() const
    {
        return desc_;
    }

    const std::string& get_name() const
    {
        return name_;
    }

    int get_iterations() const
    {
        return iterations_;
    }

    // Count of iterations which matched
    int get_matched() const
    {
        return matched_;
    }

    void run()
    {
        matched_ = 0;
        for (int i = 0; i < iterations_; ++i)
        {
            if (iterate())
                ++matched_;
        }
    }

protected:
    // One iteration, return true when it matched
    virtual bool iterate() = 0;

private:
    std::string name_;
    std::string desc_;
    int iterations_;
    int matched_;
};

class benchmarks
{
public:
    benchmarks() = default;
    benchmarks(const benchmarks &) = delete;
    void operator = (const benchmarks &) = delete;

    void add_benchmark(benchmark_base *b)
    {
        benchmarks_.push_back(b);
    }

    void run_benchmarks()
    {
        for (auto b : benchmarks_)
        {
            timer t;
            t.start();
            b->run();

            auto elapsed = t.elapsed_milliseconds();
            printf("[%s](%s): %.2f milliseconds, %d/%d matched.\n",
                   b->get_name().c_str(), b->get_desc().c_str(),
                   elapsed, b->get_matched(), b->get_iterations());
        }
    }

private:
    std::vector<benchmark_base *> benchmarks_;
};

extern benchmarks g_benchmarks;

#define BENCHMARK(name, desc, iterations)                               \
    struct benchmark_##name : public benchmark_base                     \
    {                                                                   \
        benchmark_##name() : benchmark_base(#name, desc, iterations)    \
        {                                                               \
            g_benchmarks.add_benchmark(this);                           \
        }                                                               \
                                                                        \
    protected:                                                          \
        virtual bool iterate() override;                                \
    } benchmark_##name##_obj;                                           \
                                                                        \
    bool benchmark_##name::iterate()

#endif // BENCHMARK_H
