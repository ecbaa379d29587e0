#ifndef TICKER_HPP
#define TICKER_HPP

class Ticker {
public:
    virtual ~Ticker() = default;

    // Blocks until the next period boundary. Returns false once no more ticks
    // will be delivered.
    virtual bool wait() = 0;
};

#endif // TICKER_HPP
